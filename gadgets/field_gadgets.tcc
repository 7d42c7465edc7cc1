/** @file
 *****************************************************************************

 Implementation of interfaces for field gadgets.

 See field_gadgets.hpp

 *****************************************************************************/

#include "field_gadgets.hpp"

template<typename FieldT>
void field_multiplication_gadget<FieldT>::generate_r1cs_constraints()
{
    if (folded){
        return;
    }
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(a.lc, b.lc, product), FMT(this->annotation_prefix, " multiplication constraint"));
}

template<typename FieldT>
void field_multiplication_gadget<FieldT>::generate_r1cs_witness()
{
    if (folded){
        return;
    }
    this->pb.val(product) = a.evaluate(this->pb) * b.evaluate(this->pb);
}

template<typename FieldT>
const field_value<FieldT> &field_multiplication_gadget<FieldT>::result() const
{
    return output;
}

template<typename FieldT>
void field_select_gadget<FieldT>::generate_r1cs_constraints()
{
    if (folded){
        return;
    }
    // bit * (when_true - when_false) = selected - when_false
    const field_value<FieldT> diff = when_true - when_false;
    const field_value<FieldT> offset = output - when_false;
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(bit.lc, diff.lc, offset.lc), FMT(this->annotation_prefix, " select constraint"));
}

template<typename FieldT>
void field_select_gadget<FieldT>::generate_r1cs_witness()
{
    if (folded){
        return;
    }
    const FieldT low = when_false.evaluate(this->pb);
    const FieldT high = when_true.evaluate(this->pb);
    this->pb.val(selected) = low + evaluate_linear_combination(this->pb, bit.lc) * (high - low);
}

template<typename FieldT>
const field_value<FieldT> &field_select_gadget<FieldT>::result() const
{
    return output;
}

template<typename FieldT>
void field_equality_gadget<FieldT>::generate_r1cs_constraints()
{
    if (folded){
        return;
    }
    const field_value<FieldT> diff = a - b;
    // (a - b) * inverse = 1 - equal
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(diff.lc, difference_inverse, 1 - equal), FMT(this->annotation_prefix, " inverse constraint"));
    // (a - b) * equal = 0
    this->pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(diff.lc, equal, FieldT::zero()), FMT(this->annotation_prefix, " zero constraint"));
}

template<typename FieldT>
void field_equality_gadget<FieldT>::generate_r1cs_witness()
{
    if (folded){
        return;
    }
    const FieldT diff = a.evaluate(this->pb) - b.evaluate(this->pb);
    if (diff.is_zero()){
        this->pb.val(equal) = FieldT::one();
        this->pb.val(difference_inverse) = FieldT::zero();
    } else {
        this->pb.val(equal) = FieldT::zero();
        this->pb.val(difference_inverse) = diff.inverse();
    }
}

template<typename FieldT>
const boolean_value<FieldT> &field_equality_gadget<FieldT>::result() const
{
    return output;
}

template<typename FieldT>
void boolean_and_gadget<FieldT>::generate_r1cs_constraints()
{
    product->generate_r1cs_constraints();
}

template<typename FieldT>
void boolean_and_gadget<FieldT>::generate_r1cs_witness()
{
    product->generate_r1cs_witness();
}

template<typename FieldT>
boolean_value<FieldT> boolean_and_gadget<FieldT>::result() const
{
    const field_value<FieldT> &p = product->result();
    return boolean_value<FieldT>(p.mode, p.lc);
}

template<typename FieldT>
void boolean_or_gadget<FieldT>::generate_r1cs_constraints()
{
    product->generate_r1cs_constraints();
}

template<typename FieldT>
void boolean_or_gadget<FieldT>::generate_r1cs_witness()
{
    product->generate_r1cs_witness();
}

template<typename FieldT>
boolean_value<FieldT> boolean_or_gadget<FieldT>::result() const
{
    const field_value<FieldT> sum = a.as_field() + b.as_field() - product->result();
    return boolean_value<FieldT>(sum.mode, sum.lc);
}
