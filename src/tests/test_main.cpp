#include <gmock/gmock.h>
#include "test_utils.hpp"

int main(int argc, char** argv) {
  testing::InitGoogleMock(&argc, argv);
  init_logging();
  return RUN_ALL_TESTS();
}
