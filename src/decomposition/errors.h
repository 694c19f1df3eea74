#ifndef PCALIX_ERRORS_H
#define PCALIX_ERRORS_H

#include <stdexcept>
#include <string>

namespace pcalix {

// 固有値分解 / SVD の失敗（非有限値の入力、非収束）
class DecompositionError : public std::runtime_error {
public:
    explicit DecompositionError(const std::string& what)
        : std::runtime_error(what) {}
};

// fit 前に transform や分散比を要求した
class InvalidStateError : public std::logic_error {
public:
    explicit InvalidStateError(const std::string& what)
        : std::logic_error(what) {}
};

// 入力の特徴量数が fit 時と一致しない
class ShapeMismatchError : public std::invalid_argument {
public:
    explicit ShapeMismatchError(const std::string& what)
        : std::invalid_argument(what) {}
};

// Total variance is zero (constant input), the ratio is undefined.
class DegenerateVarianceError : public std::runtime_error {
public:
    explicit DegenerateVarianceError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace pcalix

#endif // PCALIX_ERRORS_H
