/** @file
 *****************************************************************************

 Declaration of interfaces for the circuit environment

 The circuit environment owns the protoboard of one circuit build and
 allocates circuit values by mode:
 Constant values are free, Public values take one of the primary input slots
 reserved at construction (libsnark requires primary inputs to be the first
 variables), Private values are auxiliary variables.

 Allocated booleans are constrained to {0, 1} immediately.
 *****************************************************************************/

#ifndef CIRCUIT_ENVIRONMENT_H
#define CIRCUIT_ENVIRONMENT_H

#include <string>
#include <vector>

#include "libsnark/gadgetlib1/protoboard.hpp"

#include "circuit/circuit_counts.hpp"
#include "circuit/field_value.hpp"

template<typename FieldT>
class circuit_environment {
private:
    std::vector<libsnark::pb_variable<FieldT>> public_slots;
    size_t next_public_slot;
    size_t constant_count;

public:
    libsnark::protoboard<FieldT> pb;

    explicit circuit_environment(size_t num_public_inputs=0);

    field_value<FieldT> new_field(circuit_mode mode, const FieldT &value, const std::string &annotation="");
    boolean_value<FieldT> new_boolean(circuit_mode mode, bool value, const std::string &annotation="");

    /**
     * Enforces a == b. If both sides are constant the relation is checked
     * right away and std::runtime_error is thrown if it does not hold.
     */
    void assert_equal(const field_value<FieldT> &a, const field_value<FieldT> &b, const std::string &annotation="");
    void assert_true(const boolean_value<FieldT> &b, const std::string &annotation="");

    FieldT eject(const field_value<FieldT> &value) const;
    bool eject(const boolean_value<FieldT> &value) const;

    size_t public_capacity() const;
    size_t num_constants() const;
    size_t num_public() const;
    size_t num_private() const;
    size_t num_constraints() const;
    circuit_counts counts() const;

    bool is_satisfied() const;
};

#include "circuit_environment.tcc"

#endif //CIRCUIT_ENVIRONMENT_H
