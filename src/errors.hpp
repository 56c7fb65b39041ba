//
//  errors.hpp
//  dmft-scf
//

#ifndef errors_hpp
#define errors_hpp

#include <stdexcept>
#include <string>


// Malformed or inconsistent input parameters; fatal before any iteration
class ConfigurationError : public std::invalid_argument {
public:
    explicit ConfigurationError(const std::string& msg) : std::invalid_argument(msg) {}
};

// Number of orbital-resolved DC shifts does not match the summed orbital dimensions of all sites
class ShiftCountMismatchError : public ConfigurationError {
public:
    explicit ShiftCountMismatchError(const std::string& msg) : ConfigurationError(msg) {}
};

class NotImplementedCombinationError : public std::logic_error {
public:
    explicit NotImplementedCombinationError(const std::string& msg) : std::logic_error(msg) {}
};

// Freshly computed and loaded states disagree
class InconsistentStateError : public std::runtime_error {
public:
    explicit InconsistentStateError(const std::string& msg) : std::runtime_error(msg) {}
};

class InconsistentDensityError : public InconsistentStateError {
public:
    explicit InconsistentDensityError(const std::string& msg) : InconsistentStateError(msg) {}
};

// Only the rotation matrices differ; callers log it and continue
class RotationMismatch : public InconsistentStateError {
public:
    explicit RotationMismatch(const std::string& msg) : InconsistentStateError(msg) {}
};

class SolverFailure : public std::runtime_error {
public:
    explicit SolverFailure(const std::string& msg) : std::runtime_error(msg) {}
};

// HDF5 call failed, or the archive lacks an entry or is opened read-only
class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& msg) : std::runtime_error(msg) {}
};

// Root search for the chemical potential did not reach the requested precision
class NumericalDivergenceWarning : public std::runtime_error {
public:
    explicit NumericalDivergenceWarning(const std::string& msg) : std::runtime_error(msg) {}
};


// Error categories used to replay a coordinator-side failure on every process
enum ErrorCode : int {NoError = 0, ConfigurationErrorCode = 1, ShiftCountErrorCode = 2, NotImplementedCode = 3, InconsistentStateCode = 4,
                      InconsistentDensityCode = 5, RotationMismatchCode = 6, SolverFailureCode = 7, NumericalDivergenceCode = 8,
                      InvalidArgumentCode = 9, RuntimeErrorCode = 10, ArchiveErrorCode = 11};

// Most derived types must be tested first
inline int errorCode(const std::exception& e) {
    if (dynamic_cast<const ShiftCountMismatchError*>(&e)) return ShiftCountErrorCode;
    if (dynamic_cast<const ConfigurationError*>(&e)) return ConfigurationErrorCode;
    if (dynamic_cast<const NotImplementedCombinationError*>(&e)) return NotImplementedCode;
    if (dynamic_cast<const InconsistentDensityError*>(&e)) return InconsistentDensityCode;
    if (dynamic_cast<const RotationMismatch*>(&e)) return RotationMismatchCode;
    if (dynamic_cast<const InconsistentStateError*>(&e)) return InconsistentStateCode;
    if (dynamic_cast<const SolverFailure*>(&e)) return SolverFailureCode;
    if (dynamic_cast<const NumericalDivergenceWarning*>(&e)) return NumericalDivergenceCode;
    if (dynamic_cast<const ArchiveError*>(&e)) return ArchiveErrorCode;
    if (dynamic_cast<const std::invalid_argument*>(&e)) return InvalidArgumentCode;
    return RuntimeErrorCode;
}

[[noreturn]] inline void throwErrorCode(const int code, const std::string& msg) {
    switch (code) {
        case ConfigurationErrorCode: throw ConfigurationError(msg);
        case ShiftCountErrorCode: throw ShiftCountMismatchError(msg);
        case NotImplementedCode: throw NotImplementedCombinationError(msg);
        case InconsistentStateCode: throw InconsistentStateError(msg);
        case InconsistentDensityCode: throw InconsistentDensityError(msg);
        case RotationMismatchCode: throw RotationMismatch(msg);
        case SolverFailureCode: throw SolverFailure(msg);
        case NumericalDivergenceCode: throw NumericalDivergenceWarning(msg);
        case InvalidArgumentCode: throw std::invalid_argument(msg);
        case ArchiveErrorCode: throw ArchiveError(msg);
        default: throw std::runtime_error(msg);
    }
}

#endif /* errors_hpp */
