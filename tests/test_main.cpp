#include <gtest/gtest.h>

#include <iostream>

int main(int argc, char **argv) {
  std::cout << "Running Vault Test Suite..." << std::endl;

  ::testing::InitGoogleTest(&argc, argv);

  // Each fixture creates its own temporary storage root
  int result = RUN_ALL_TESTS();

  if (result != 0) {
    std::cout << "Some tests failed. Check output above for details." << std::endl;
  }

  return result;
}
