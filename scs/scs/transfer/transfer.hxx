#pragma once

#include <scs/transfer/transfer-types.hxx>
#include <scs/transfer/transfer-planner.hxx>
#include <scs/transfer/transfer-range.hxx>
#include <scs/transfer/transfer-file.hxx>
#include <scs/transfer/transfer-part.hxx>
#include <scs/transfer/transfer-engine.hxx>
