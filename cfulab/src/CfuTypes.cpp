// **********************************************************************
// cfulab/src/CfuTypes.cpp
// **********************************************************************

#include "CfuTypes.hpp"

namespace cfulab {

const char* status_name(CfuStatus status) {
  switch (status) {
    case CfuStatus::Idle:    return "Idle";
    case CfuStatus::Issued:  return "Issued";
    case CfuStatus::Busy:    return "Busy";
    case CfuStatus::Done:    return "Done";
    case CfuStatus::Faulted: return "Faulted";
  }
  return "?";
}

} // namespace cfulab
