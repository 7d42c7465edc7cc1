/** @file
 *****************************************************************************

 Declaration of interfaces for field gadgets

 Nonlinear operations on circuit values. Every gadget folds operands of
 Constant mode and only allocates variables / emits constraints for the
 remaining cases. Which case applies depends on the operand modes only,
 never on witness values.

 field_multiplication_gadget: result = a * b, one constraint unless an
 operand is constant

 field_select_gadget: result = when_false + bit * (when_true - when_false),
 an arithmetic multiplexer with one constraint

 field_equality_gadget: boolean result, true iff a == b, two constraints

 boolean_and_gadget, boolean_or_gadget: a * b and a + b - a * b
 *****************************************************************************/

#ifndef FIELD_GADGETS_H
#define FIELD_GADGETS_H

#include <memory>

#include "libsnark/gadgetlib1/gadget.hpp"
#include "libsnark/gadgetlib1/protoboard.hpp"

#include "circuit/field_value.hpp"

template<typename FieldT>
class field_multiplication_gadget : public libsnark::gadget<FieldT> {
private:
    libsnark::pb_variable<FieldT> product;
    field_value<FieldT> output;
    bool folded;

public:
    const field_value<FieldT> a;
    const field_value<FieldT> b;

    field_multiplication_gadget(libsnark::protoboard<FieldT> &pb,
                                const field_value<FieldT> &a,
                                const field_value<FieldT> &b,
                                const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), folded(true), a(a), b(b)
    {
        const circuit_mode mode = combine_modes(a.mode, b.mode);
        if (a.is_constant()){
            output = field_value<FieldT>(mode, scale_linear_combination(b.lc, a.constant_value()));
        } else if (b.is_constant()){
            output = field_value<FieldT>(mode, scale_linear_combination(a.lc, b.constant_value()));
        } else {
            folded = false;
            product.allocate(pb, FMT(this->annotation_prefix, " product"));
            output = field_value<FieldT>::from_variable(mode, product);
        }
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    const field_value<FieldT> &result() const;
};

template<typename FieldT>
class field_select_gadget : public libsnark::gadget<FieldT> {
private:
    libsnark::pb_variable<FieldT> selected;
    field_value<FieldT> output;
    bool folded;

public:
    const boolean_value<FieldT> bit;
    const field_value<FieldT> when_false;
    const field_value<FieldT> when_true;

    field_select_gadget(libsnark::protoboard<FieldT> &pb,
                        const boolean_value<FieldT> &bit,
                        const field_value<FieldT> &when_false,
                        const field_value<FieldT> &when_true,
                        const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), folded(true),
            bit(bit), when_false(when_false), when_true(when_true)
    {
        const circuit_mode mode = combine_modes({bit.mode, when_false.mode, when_true.mode});
        const field_value<FieldT> diff = when_true - when_false;
        if (bit.is_constant()){
            output = field_value<FieldT>(mode, bit.constant_value() ? when_true.lc : when_false.lc);
        } else if (diff.is_constant()){
            output = field_value<FieldT>(mode, (when_false + diff.constant_value() * bit.as_field()).lc);
        } else {
            folded = false;
            selected.allocate(pb, FMT(this->annotation_prefix, " selected"));
            output = field_value<FieldT>::from_variable(mode, selected);
        }
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    const field_value<FieldT> &result() const;
};

template<typename FieldT>
class field_equality_gadget : public libsnark::gadget<FieldT> {
private:
    libsnark::pb_variable<FieldT> equal;
    libsnark::pb_variable<FieldT> difference_inverse;
    boolean_value<FieldT> output;
    bool folded;

public:
    const field_value<FieldT> a;
    const field_value<FieldT> b;

    field_equality_gadget(libsnark::protoboard<FieldT> &pb,
                          const field_value<FieldT> &a,
                          const field_value<FieldT> &b,
                          const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), folded(true), a(a), b(b)
    {
        const field_value<FieldT> diff = a - b;
        if (diff.is_constant()){
            output = boolean_value<FieldT>::constant(diff.constant_value().is_zero());
        } else {
            folded = false;
            equal.allocate(pb, FMT(this->annotation_prefix, " equal"));
            difference_inverse.allocate(pb, FMT(this->annotation_prefix, " difference inverse"));
            output = boolean_value<FieldT>(diff.mode, libsnark::linear_combination<FieldT>(equal));
        }
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    const boolean_value<FieldT> &result() const;
};

template<typename FieldT>
class boolean_and_gadget : public libsnark::gadget<FieldT> {
private:
    std::shared_ptr<field_multiplication_gadget<FieldT> > product;

public:
    const boolean_value<FieldT> a;
    const boolean_value<FieldT> b;

    boolean_and_gadget(libsnark::protoboard<FieldT> &pb,
                       const boolean_value<FieldT> &a,
                       const boolean_value<FieldT> &b,
                       const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), a(a), b(b)
    {
        product.reset(new field_multiplication_gadget<FieldT>(pb, a.as_field(), b.as_field(),
                                                              FMT(this->annotation_prefix, " product")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    boolean_value<FieldT> result() const;
};

template<typename FieldT>
class boolean_or_gadget : public libsnark::gadget<FieldT> {
private:
    std::shared_ptr<field_multiplication_gadget<FieldT> > product;

public:
    const boolean_value<FieldT> a;
    const boolean_value<FieldT> b;

    boolean_or_gadget(libsnark::protoboard<FieldT> &pb,
                      const boolean_value<FieldT> &a,
                      const boolean_value<FieldT> &b,
                      const std::string &annotation_prefix="") :
            libsnark::gadget<FieldT>(pb, annotation_prefix), a(a), b(b)
    {
        product.reset(new field_multiplication_gadget<FieldT>(pb, a.as_field(), b.as_field(),
                                                              FMT(this->annotation_prefix, " product")));
    };

    void generate_r1cs_constraints();
    void generate_r1cs_witness();

    boolean_value<FieldT> result() const;
};

#include "field_gadgets.tcc"

#endif //FIELD_GADGETS_H
