/** @file
 *****************************************************************************

 Build-time errors of circuit construction

 arity_mismatch: a hash gadget (or its native counterpart) received a number
 of inputs that differs from the arity of its parameters

 Other configuration errors use std::invalid_argument directly.
 *****************************************************************************/

#ifndef CIRCUIT_ERRORS_H
#define CIRCUIT_ERRORS_H

#include <stdexcept>
#include <string>

class arity_mismatch : public std::invalid_argument {
public:
    const size_t expected;
    const size_t actual;

    arity_mismatch(size_t expected, size_t actual, const std::string &context) :
            std::invalid_argument(context + ": expected " + std::to_string(expected) +
                                  " inputs, got " + std::to_string(actual)),
            expected(expected), actual(actual) {}
};

#endif //CIRCUIT_ERRORS_H
