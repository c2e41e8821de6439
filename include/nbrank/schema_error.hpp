#ifndef NBRANK_SCHEMA_ERROR_HPP
#define NBRANK_SCHEMA_ERROR_HPP

#include <stdexcept>
#include <string>

namespace nbrank {

// An n-best record lacks or misaligns a field required by the metric.
class schema_error : public std::runtime_error {
public:
    explicit schema_error(const std::string & what_arg)
        : std::runtime_error(what_arg) {}
};

}  // namespace nbrank

#endif  // NBRANK_SCHEMA_ERROR_HPP
