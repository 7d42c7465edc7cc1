/** @file
 *****************************************************************************

 Implementation of interfaces for circuit values.

 See field_value.hpp

 *****************************************************************************/

#include <algorithm>
#include <stdexcept>

#include "field_value.hpp"

template<typename FieldT>
libsnark::linear_combination<FieldT> merge_linear_combinations(const libsnark::linear_combination<FieldT> &lhs,
                                                               const libsnark::linear_combination<FieldT> &rhs,
                                                               const FieldT &coeff)
{
    std::vector<libsnark::linear_term<FieldT> > all_terms(lhs.terms.begin(), lhs.terms.end());
    all_terms.reserve(lhs.terms.size() + rhs.terms.size());
    for (size_t i = 0; i < rhs.terms.size(); ++i){
        all_terms.emplace_back(libsnark::variable<FieldT>(rhs.terms[i].index), coeff * rhs.terms[i].coeff);
    }

    std::stable_sort(all_terms.begin(), all_terms.end(),
                     [](const libsnark::linear_term<FieldT> &x, const libsnark::linear_term<FieldT> &y) {
                         return x.index < y.index;
                     });

    libsnark::linear_combination<FieldT> result;
    size_t i = 0;
    while (i < all_terms.size()){
        const libsnark::var_index_t index = all_terms[i].index;
        FieldT sum = FieldT::zero();
        while (i < all_terms.size() && all_terms[i].index == index){
            sum += all_terms[i].coeff;
            ++i;
        }
        if (!sum.is_zero()){
            result.add_term(libsnark::variable<FieldT>(index), sum);
        }
    }
    return result;
}

template<typename FieldT>
libsnark::linear_combination<FieldT> scale_linear_combination(const libsnark::linear_combination<FieldT> &lc,
                                                              const FieldT &coeff)
{
    return merge_linear_combinations(libsnark::linear_combination<FieldT>(), lc, coeff);
}

template<typename FieldT>
FieldT evaluate_linear_combination(const libsnark::protoboard<FieldT> &pb,
                                   const libsnark::linear_combination<FieldT> &lc)
{
    FieldT result = FieldT::zero();
    for (size_t i = 0; i < lc.terms.size(); ++i){
        result += lc.terms[i].coeff * pb.val(libsnark::pb_variable<FieldT>(lc.terms[i].index));
    }
    return result;
}

template<typename FieldT>
field_value<FieldT> field_value<FieldT>::constant(const FieldT &value)
{
    libsnark::linear_combination<FieldT> lc;
    if (!value.is_zero()){
        lc.add_term(libsnark::variable<FieldT>(0), value);
    }
    return field_value<FieldT>(Constant, lc);
}

template<typename FieldT>
field_value<FieldT> field_value<FieldT>::from_variable(circuit_mode mode, const libsnark::pb_variable<FieldT> &var)
{
    return field_value<FieldT>(mode, libsnark::linear_combination<FieldT>(var));
}

template<typename FieldT>
bool field_value<FieldT>::is_constant() const
{
    return mode == Constant;
}

template<typename FieldT>
FieldT field_value<FieldT>::constant_value() const
{
    FieldT result = FieldT::zero();
    for (size_t i = 0; i < lc.terms.size(); ++i){
        if (lc.terms[i].index != 0){
            throw std::logic_error("constant_value() called on a " + mode_to_string(mode) + " value with variable terms");
        }
        result += lc.terms[i].coeff;
    }
    return result;
}

template<typename FieldT>
FieldT field_value<FieldT>::evaluate(const libsnark::protoboard<FieldT> &pb) const
{
    return evaluate_linear_combination(pb, lc);
}

template<typename FieldT>
boolean_value<FieldT> boolean_value<FieldT>::constant(bool value)
{
    return boolean_value<FieldT>(Constant, field_value<FieldT>::constant(value ? FieldT::one() : FieldT::zero()).lc);
}

template<typename FieldT>
bool boolean_value<FieldT>::is_constant() const
{
    return as_field().is_constant();
}

template<typename FieldT>
bool boolean_value<FieldT>::constant_value() const
{
    return as_field().constant_value() == FieldT::one();
}

template<typename FieldT>
bool boolean_value<FieldT>::evaluate(const libsnark::protoboard<FieldT> &pb) const
{
    return evaluate_linear_combination(pb, lc) == FieldT::one();
}

template<typename FieldT>
field_value<FieldT> boolean_value<FieldT>::as_field() const
{
    return field_value<FieldT>(mode, lc);
}

template<typename FieldT>
field_value<FieldT> operator+(const field_value<FieldT> &a, const field_value<FieldT> &b)
{
    return field_value<FieldT>(combine_modes(a.mode, b.mode), merge_linear_combinations(a.lc, b.lc, FieldT::one()));
}

template<typename FieldT>
field_value<FieldT> operator-(const field_value<FieldT> &a, const field_value<FieldT> &b)
{
    return field_value<FieldT>(combine_modes(a.mode, b.mode), merge_linear_combinations(a.lc, b.lc, -FieldT::one()));
}

template<typename FieldT>
field_value<FieldT> operator-(const field_value<FieldT> &a)
{
    return field_value<FieldT>(a.mode, scale_linear_combination(a.lc, -FieldT::one()));
}

template<typename FieldT>
field_value<FieldT> operator+(const field_value<FieldT> &a, const FieldT &c)
{
    return a + field_value<FieldT>::constant(c);
}

template<typename FieldT>
field_value<FieldT> operator*(const FieldT &c, const field_value<FieldT> &a)
{
    return field_value<FieldT>(a.mode, scale_linear_combination(a.lc, c));
}

template<typename FieldT>
field_value<FieldT> operator*(const field_value<FieldT> &a, const FieldT &c)
{
    return c * a;
}

template<typename FieldT>
boolean_value<FieldT> operator!(const boolean_value<FieldT> &b)
{
    const field_value<FieldT> negated = field_value<FieldT>::constant(FieldT::one()) - b.as_field();
    return boolean_value<FieldT>(b.mode, negated.lc);
}
