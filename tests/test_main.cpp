#include <gtest/gtest.h>

#include <iostream>

int main(int argc, char **argv) {
  std::cout << "Running Passage Test Suite..." << std::endl;

  ::testing::InitGoogleTest(&argc, argv);

  // Fixtures create their own temporary databases; no global setup required
  int result = RUN_ALL_TESTS();

  if (result == 0) {
    std::cout << "All tests passed!" << std::endl;
  } else {
    std::cout << "Some tests failed. Check output above for details." << std::endl;
  }

  return result;
}
