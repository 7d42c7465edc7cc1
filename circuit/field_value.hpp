/** @file
 *****************************************************************************

 Declaration of interfaces for circuit values

 field_value: a field element in the circuit, given by a mode and a linear
 combination over protoboard variables. Constant values only use the
 constant variable ONE.

 boolean_value: a field value that is known to be 0 or 1.

 Linear operations (addition, subtraction, negation, scaling by a constant)
 never allocate variables or emit constraints, they only merge linear
 combinations and combine modes. Products need a gadget,
 see gadgets/field_gadgets.hpp
 *****************************************************************************/

#ifndef FIELD_VALUE_H
#define FIELD_VALUE_H

#include "libsnark/gadgetlib1/pb_variable.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"
#include "libsnark/relations/variable.hpp"

#include "circuit/circuit_mode.hpp"

/**
 * Returns lhs + coeff * rhs with terms sorted by variable index,
 * duplicate indices merged and zero terms removed
 */
template<typename FieldT>
libsnark::linear_combination<FieldT> merge_linear_combinations(const libsnark::linear_combination<FieldT> &lhs,
                                                               const libsnark::linear_combination<FieldT> &rhs,
                                                               const FieldT &coeff);

template<typename FieldT>
libsnark::linear_combination<FieldT> scale_linear_combination(const libsnark::linear_combination<FieldT> &lc,
                                                              const FieldT &coeff);

template<typename FieldT>
FieldT evaluate_linear_combination(const libsnark::protoboard<FieldT> &pb,
                                   const libsnark::linear_combination<FieldT> &lc);

template<typename FieldT>
class field_value {
public:
    circuit_mode mode;
    libsnark::linear_combination<FieldT> lc;

    // constant zero
    field_value() : mode(Constant), lc() {}

    field_value(circuit_mode mode, const libsnark::linear_combination<FieldT> &lc) :
            mode(mode), lc(lc) {}

    static field_value<FieldT> constant(const FieldT &value);
    static field_value<FieldT> from_variable(circuit_mode mode, const libsnark::pb_variable<FieldT> &var);

    // Constant mode, the linear combination only refers to ONE
    bool is_constant() const;

    /**
     * Value of a constant, computed without a protoboard
     * Throws std::logic_error if the value is not constant
     */
    FieldT constant_value() const;

    FieldT evaluate(const libsnark::protoboard<FieldT> &pb) const;
};

template<typename FieldT>
class boolean_value {
public:
    circuit_mode mode;
    libsnark::linear_combination<FieldT> lc;

    // constant false
    boolean_value() : mode(Constant), lc() {}

    // lc must already be constrained to {0, 1}
    boolean_value(circuit_mode mode, const libsnark::linear_combination<FieldT> &lc) :
            mode(mode), lc(lc) {}

    static boolean_value<FieldT> constant(bool value);

    bool is_constant() const;
    bool constant_value() const;
    bool evaluate(const libsnark::protoboard<FieldT> &pb) const;

    field_value<FieldT> as_field() const;
};

template<typename FieldT>
field_value<FieldT> operator+(const field_value<FieldT> &a, const field_value<FieldT> &b);

template<typename FieldT>
field_value<FieldT> operator-(const field_value<FieldT> &a, const field_value<FieldT> &b);

template<typename FieldT>
field_value<FieldT> operator-(const field_value<FieldT> &a);

template<typename FieldT>
field_value<FieldT> operator+(const field_value<FieldT> &a, const FieldT &c);

template<typename FieldT>
field_value<FieldT> operator*(const FieldT &c, const field_value<FieldT> &a);

template<typename FieldT>
field_value<FieldT> operator*(const field_value<FieldT> &a, const FieldT &c);

// 1 - b
template<typename FieldT>
boolean_value<FieldT> operator!(const boolean_value<FieldT> &b);

#include "field_value.tcc"

#endif //FIELD_VALUE_H
