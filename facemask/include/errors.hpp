#pragma once

#include <stdexcept>
#include <string>

namespace facemask {

class InferenceError : public std::runtime_error {
public:
    explicit InferenceError(const std::string& what) : std::runtime_error(what) {}
};

// Detector exceeded its time budget. The call may still be running on the worker.
class InferenceTimeout : public InferenceError {
public:
    explicit InferenceTimeout(const std::string& what) : InferenceError(what) {}
};

// Detector threw, could not be loaded, or the adapter is not usable.
class InferenceFailure : public InferenceError {
public:
    explicit InferenceFailure(const std::string& what) : InferenceError(what) {}
};

}  // namespace facemask
