#pragma once

#include <scs/oci/oci-types.hxx>
#include <scs/oci/oci-digest.hxx>
#include <scs/oci/oci-auth.hxx>
#include <scs/oci/oci-registry.hxx>
