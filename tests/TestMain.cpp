#include "GnomeMcp/Utils/Definitions.hpp"
#include "GnomeMcp/Utils/Logging.hpp"
#include "GnomeMcp/Utils/Types.hpp"

#include "gtest/gtest.h"

using gnome_mcp::utils::types::i32;

fn main(i32 argc, char** argv) -> i32 {
  // Keep provider and router diagnostics out of the test report.
  gnome_mcp::utils::logging::SetRuntimeLogLevel(gnome_mcp::utils::logging::LogLevel::Error);

  testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
