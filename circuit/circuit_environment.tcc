/** @file
 *****************************************************************************

 Implementation of interfaces for the circuit environment.

 See circuit_environment.hpp

 *****************************************************************************/

#include <stdexcept>

#include "circuit_environment.hpp"

template<typename FieldT>
circuit_environment<FieldT>::circuit_environment(size_t num_public_inputs) :
        public_slots(), next_public_slot(0), constant_count(0), pb()
{
    for (size_t i = 0; i < num_public_inputs; ++i){
        libsnark::pb_variable<FieldT> slot;
        slot.allocate(pb, FMT("public_input", "_%zu", i));
        public_slots.push_back(slot);
    }
    pb.set_input_sizes(num_public_inputs);
}

template<typename FieldT>
field_value<FieldT> circuit_environment<FieldT>::new_field(circuit_mode mode, const FieldT &value, const std::string &annotation)
{
    libsnark::pb_variable<FieldT> var;
    switch (mode){
        case Constant:
            ++constant_count;
            return field_value<FieldT>::constant(value);
        case Public:
            if (next_public_slot >= public_slots.size()){
                throw std::runtime_error("cannot allocate public value '" + annotation + "': all " +
                                         std::to_string(public_slots.size()) + " reserved public inputs are in use");
            }
            var = public_slots[next_public_slot++];
            break;
        case Private:
            var.allocate(pb, annotation);
            break;
    }
    pb.val(var) = value;
    return field_value<FieldT>::from_variable(mode, var);
}

template<typename FieldT>
boolean_value<FieldT> circuit_environment<FieldT>::new_boolean(circuit_mode mode, bool value, const std::string &annotation)
{
    const field_value<FieldT> v = new_field(mode, value ? FieldT::one() : FieldT::zero(), annotation);
    if (mode != Constant){
        // v * (1 - v) = 0
        const field_value<FieldT> one_minus_v = field_value<FieldT>::constant(FieldT::one()) - v;
        pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(v.lc, one_minus_v.lc, FieldT::zero()),
                               FMT(annotation, ".bitness"));
    }
    return boolean_value<FieldT>(v.mode, v.lc);
}

template<typename FieldT>
void circuit_environment<FieldT>::assert_equal(const field_value<FieldT> &a, const field_value<FieldT> &b, const std::string &annotation)
{
    const field_value<FieldT> diff = a - b;
    if (diff.is_constant()){
        if (!diff.constant_value().is_zero()){
            throw std::runtime_error("constant assertion failed: " + annotation);
        }
        return;
    }
    pb.add_r1cs_constraint(libsnark::r1cs_constraint<FieldT>(FieldT::one(), diff.lc, FieldT::zero()),
                           FMT(annotation, ".equal"));
}

template<typename FieldT>
void circuit_environment<FieldT>::assert_true(const boolean_value<FieldT> &b, const std::string &annotation)
{
    assert_equal(b.as_field(), field_value<FieldT>::constant(FieldT::one()), annotation);
}

template<typename FieldT>
FieldT circuit_environment<FieldT>::eject(const field_value<FieldT> &value) const
{
    return value.evaluate(pb);
}

template<typename FieldT>
bool circuit_environment<FieldT>::eject(const boolean_value<FieldT> &value) const
{
    return value.evaluate(pb);
}

template<typename FieldT>
size_t circuit_environment<FieldT>::public_capacity() const
{
    return public_slots.size();
}

template<typename FieldT>
size_t circuit_environment<FieldT>::num_constants() const
{
    return constant_count;
}

template<typename FieldT>
size_t circuit_environment<FieldT>::num_public() const
{
    return next_public_slot;
}

template<typename FieldT>
size_t circuit_environment<FieldT>::num_private() const
{
    return pb.num_variables() - public_slots.size();
}

template<typename FieldT>
size_t circuit_environment<FieldT>::num_constraints() const
{
    return pb.num_constraints();
}

template<typename FieldT>
circuit_counts circuit_environment<FieldT>::counts() const
{
    circuit_counts result;
    result.num_constants = num_constants();
    result.num_public = num_public();
    result.num_private = num_private();
    result.num_constraints = num_constraints();
    return result;
}

template<typename FieldT>
bool circuit_environment<FieldT>::is_satisfied() const
{
    return pb.is_satisfied();
}
