#include <zb/error.hpp>

namespace zb {

const char* ZbError::code_name(Code c) {
    switch (c) {
        case UnknownFormula:     return "UnknownFormula";
        case CyclicDependency:   return "CyclicDependency";
        case VersionConflict:    return "VersionConflict";
        case UnsupportedTap:     return "UnsupportedTap";
        case NoCompatibleBottle: return "NoCompatibleBottle";
        case TransportFailure:   return "TransportFailure";
        case IntegrityError:     return "IntegrityError";
        case Timeout:            return "Timeout";
        case ExtractionFailure:  return "ExtractionFailure";
        case RenameRaceLost:     return "RenameRaceLost";
        case DiskFull:           return "DiskFull";
        case LinkConflict:       return "LinkConflict";
        case LockTimeout:        return "LockTimeout";
        case StaleLockRecovered: return "StaleLockRecovered";
        case DatabaseCorrupt:    return "DatabaseCorrupt";
        case DatabaseIO:         return "DatabaseIO";
        case DependencyFailed:   return "DependencyFailed";
        case Aborted:            return "Aborted";
        case NotInstalled:       return "NotInstalled";
        case HasDependents:      return "HasDependents";
        case IO:                 return "IO";
        case Parse:              return "Parse";
        case Version:            return "Version";
        case Config:             return "Config";
        case InvalidArg:         return "InvalidArg";
        case NotFound:           return "NotFound";
    }
    return "Unknown";
}

const char* ZbError::category(Code c) {
    switch (c) {
        case UnknownFormula:
        case CyclicDependency:
        case VersionConflict:
        case UnsupportedTap:
            return "ResolutionError";
        case NoCompatibleBottle:
            return "SelectionError";
        case TransportFailure:
        case IntegrityError:
        case Timeout:
            return "FetchError";
        case ExtractionFailure:
        case RenameRaceLost:
        case DiskFull:
        case LinkConflict:
            return "StoreError";
        case LockTimeout:
        case StaleLockRecovered:
            return "LockError";
        case DatabaseCorrupt:
        case DatabaseIO:
            return "DatabaseError";
        case DependencyFailed:
        case Aborted:
        case NotInstalled:
        case HasDependents:
            return "InstallError";
        case IO:
        case Parse:
        case Version:
        case Config:
        case InvalidArg:
        case NotFound:
            return "Error";
    }
    return "Error";
}

std::string ZbError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace zb
