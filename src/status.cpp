// -----------------------------------------------------------------------------
// @file status.cpp
// @brief Names and one-line diagnostics for ledgerpack::Status.
// -----------------------------------------------------------------------------
#include "ledgerpack/status.hpp"

#include <iomanip>
#include <sstream>

namespace ledgerpack {

const char* to_string(Status s) {
  switch (s) {
    case Status::Ok:                   return "Ok";
    case Status::MalformedEncoding:    return "MalformedEncoding";
    case Status::KeyBudgetExceeded:    return "KeyBudgetExceeded";
    case Status::ValueBudgetExceeded:  return "ValueBudgetExceeded";
    case Status::IncompleteData:       return "IncompleteData";
    case Status::DuplicateIndex:       return "DuplicateIndex";
    case Status::ChecksumMismatch:     return "ChecksumMismatch";
    case Status::InvalidLimits:        return "InvalidLimits";
    case Status::InvalidNamespace:     return "InvalidNamespace";
    case Status::RecordBudgetExceeded: return "RecordBudgetExceeded";
    case Status::BadManifest:          return "BadManifest";
    case Status::BadRecordFile:        return "BadRecordFile";
    case Status::BadProfile:           return "BadProfile";
    case Status::IoError:              return "IoError";
  }
  return "Unknown";
}

std::string describe(const Fault& f) {
  std::ostringstream out;
  out << to_string(f.status);

  switch (f.status) {
    case Status::Ok:
      break;
    case Status::MalformedEncoding:
      out << ": invalid symbol or final group at offset " << f.index;
      break;
    case Status::KeyBudgetExceeded:
      out << ": keys need " << f.actual << " characters, limit is " << f.expected;
      break;
    case Status::ValueBudgetExceeded:
      out << ": metadata value needs " << f.actual << " characters, limit is " << f.expected;
      break;
    case Status::IncompleteData:
      out << ": expected " << f.expected << " records, found " << f.actual;
      break;
    case Status::DuplicateIndex:
      out << ": conflicting values for record index " << f.index;
      break;
    case Status::ChecksumMismatch:
      out << std::hex << std::setfill('0')
          << ": expected crc32 " << std::setw(8) << f.expected
          << ", got " << std::setw(8) << f.actual;
      break;
    case Status::InvalidLimits:
      out << ": limit " << f.actual << " outside 1.." << f.expected;
      break;
    case Status::RecordBudgetExceeded:
      out << ": payload needs " << f.actual << " records, profile allows " << f.expected;
      break;
    default:
      break;
  }
  return out.str();
}

} // namespace ledgerpack
