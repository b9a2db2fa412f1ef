#ifndef VIGIL_EXCEPTIONS_H
#define VIGIL_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace Vigil {

// Structural and type contracts checked on estimator inputs, in evaluation order.
enum class InputContract {
    TABLE_INTEGRITY,
    FEATURE_ROW_SHAPE,
    REFERENCE_SHAPE,
    WEIGHTS_SHAPE,
    REFERENCE_TIME_WINDOW,
    REFERENCE_COLUMNS,
    WEIGHTS_COLUMNS,
    FEATURE_VALUE_TYPES,
    WINDOW_WEIGHT_TYPES,
    WINDOW_COVERAGE
};

const char* inputContractName(InputContract contract) noexcept;

class VigilException : public std::runtime_error {
public:
    explicit VigilException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public VigilException {
public:
    explicit IOException(const std::string& message) : VigilException("IO Error: " + message) {}
};

class DatasetException : public VigilException {
public:
    explicit DatasetException(const std::string& message) : VigilException("Dataset Error: " + message) {}
};

class ConfigurationException : public VigilException {
public:
    explicit ConfigurationException(const std::string& message) : VigilException("Configuration Error: " + message) {}
};

class InvalidInputException : public VigilException {
public:
    InvalidInputException(InputContract contract, const std::string& message)
        : VigilException("Invalid Input [" + std::string(inputContractName(contract)) + "]: " + message),
          contract_(contract) {}

    InputContract contract() const noexcept { return contract_; }

private:
    InputContract contract_;
};

class DirectionException : public VigilException {
public:
    explicit DirectionException(const std::string& message) : VigilException("Direction Error: " + message) {}
};

class CombinerTypeException : public VigilException {
public:
    explicit CombinerTypeException(const std::string& message) : VigilException("Combiner Type Error: " + message) {}
};

class CombinerValueException : public VigilException {
public:
    explicit CombinerValueException(const std::string& message) : VigilException("Combiner Value Error: " + message) {}
};

} // namespace Vigil

#endif // VIGIL_EXCEPTIONS_H
