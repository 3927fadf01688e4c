#pragma once

#include <string>
#include <cstdint>

#include <scs/transfer/transfer-types.hxx>

namespace scs
{
  // Split [0, size) into consecutive parts of spec.part_size bytes, the
  // last one taking the remainder.
  //
  // Throws scs::error with invalid_size if size is not positive and with
  // invalid_part_size if the part size is not.
  //
  part_plan
  plan_parts (std::int64_t size, const transfer_spec& spec);

  // One-line summary of a plan for the log.
  //
  std::string
  to_string (const part_plan&);
}
