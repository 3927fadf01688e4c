#pragma once

#include <string>
#include <cstdint>

#include <scs/oci/oci-types.hxx>
#include <scs/oci/oci-digest.hxx>

namespace scs
{
  // Fixed layout of a SIF v1 file (all integers little-endian).
  //
  namespace sif
  {
    constexpr std::size_t header_size     = 128;
    constexpr std::size_t descriptor_size = 585;

    constexpr std::int32_t datatype_partition = 0x4004;
    constexpr std::int32_t datatype_signature = 0x4005;

    constexpr std::int32_t fstype_encrypted_squashfs = 5;
    constexpr std::int32_t parttype_primary_system   = 2;
  }

  // What the image file says about itself.
  //
  struct sif_summary
  {
    std::string version;

    // Go-style architecture name (amd64, arm64, ...), taken from the primary
    // system partition if there is one and from the global header
    // otherwise. Empty if neither names a known architecture.
    //
    std::string architecture;

    std::uint64_t descriptors_total = 0;
    std::uint64_t descriptors_used = 0;

    bool has_primary_partition = false;
    bool is_signed = false;
    bool is_encrypted = false;
  };

  // Map a SIF architecture code ("02") to its Go-style name, empty if
  // unknown.
  //
  std::string
  sif_architecture (const std::string& code);

  // Parse the global header and descriptor table from the leading bytes of
  // an image. The descriptor table must lie within the buffer.
  //
  // Throws scs::error with invalid_sif.
  //
  sif_summary
  parse_sif_header (const std::string& probe);

  // Image config for an image with the given summary whose layer (the
  // whole file) has digest rootfs. Throws scs::error with
  // invalid_image_config if the architecture is unknown.
  //
  image_config
  make_image_config (const sif_summary&,
                     const digest& rootfs,
                     const std::string& description = std::string ());
}
