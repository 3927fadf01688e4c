#pragma once

#include <string>
#include <functional>

namespace scs
{
  // Diagnostic line sink. An empty function discards everything.
  //
  using log_function = std::function<void (const std::string&)>;

  inline void
  log (const log_function& f, const std::string& m)
  {
    if (f)
      f (m);
  }
}
