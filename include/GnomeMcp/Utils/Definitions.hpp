#pragma once

#ifndef GMCP_VERSION
  #define GMCP_VERSION "0.0.0-dev"
#endif

/// Macro alias for trailing return type functions.
#define fn auto
