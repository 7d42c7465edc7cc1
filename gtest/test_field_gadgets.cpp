#include <gtest/gtest.h>

#include "circuit/circuit_environment.hpp"
#include "gadgets/field_gadgets.hpp"

#include "utiltest.h"

TEST(FieldMultiplication, Variables) {
    circuit_environment<FieldT> env;
    const field_value<FieldT> a = env.new_field(Private, field(6), "a");
    const field_value<FieldT> b = env.new_field(Private, field(7), "b");

    field_multiplication_gadget<FieldT> mul(env.pb, a, b, "mul");
    mul.generate_r1cs_constraints();
    mul.generate_r1cs_witness();

    EXPECT_EQ(1u, env.num_constraints());
    EXPECT_EQ(field(42), env.eject(mul.result()));
    EXPECT_EQ(Private, mul.result().mode);
    EXPECT_TRUE(env.is_satisfied());
}

TEST(FieldMultiplication, ConstantOperandIsFolded) {
    circuit_environment<FieldT> env(1);
    const field_value<FieldT> a = env.new_field(Public, field(6), "a");
    const field_value<FieldT> b = field_value<FieldT>::constant(field(7));

    field_multiplication_gadget<FieldT> mul(env.pb, a, b, "mul");
    mul.generate_r1cs_constraints();
    mul.generate_r1cs_witness();

    EXPECT_EQ(0u, env.num_constraints());
    EXPECT_EQ(0u, env.num_private());
    EXPECT_EQ(field(42), env.eject(mul.result()));
    EXPECT_EQ(Public, mul.result().mode);
}

TEST(FieldSelect, PrivateBit) {
    for (int bit = 0; bit < 2; ++bit){
        circuit_environment<FieldT> env;
        const boolean_value<FieldT> d = env.new_boolean(Private, bit == 1, "d");
        const field_value<FieldT> lo = env.new_field(Private, field(11), "lo");
        const field_value<FieldT> hi = env.new_field(Private, field(22), "hi");
        const size_t before = env.num_constraints();

        field_select_gadget<FieldT> select(env.pb, d, lo, hi, "select");
        select.generate_r1cs_constraints();
        select.generate_r1cs_witness();

        EXPECT_EQ(1u, env.num_constraints() - before);
        EXPECT_EQ(bit == 1 ? field(22) : field(11), env.eject(select.result()));
        EXPECT_TRUE(env.is_satisfied());
    }
}

TEST(FieldSelect, WrongSelectionIsUnsatisfied) {
    circuit_environment<FieldT> env;
    const boolean_value<FieldT> d = env.new_boolean(Private, true, "d");
    const field_value<FieldT> lo = env.new_field(Private, field(11), "lo");
    const field_value<FieldT> hi = env.new_field(Private, field(22), "hi");

    field_select_gadget<FieldT> select(env.pb, d, lo, hi, "select");
    select.generate_r1cs_constraints();
    select.generate_r1cs_witness();

    env.pb.val(libsnark::pb_variable<FieldT>(select.result().lc.terms[0].index)) = field(11);
    EXPECT_FALSE(env.is_satisfied());
}

TEST(FieldSelect, ConstantBitSelectsDirectly) {
    circuit_environment<FieldT> env;
    const field_value<FieldT> lo = env.new_field(Private, field(11), "lo");
    const field_value<FieldT> hi = env.new_field(Private, field(22), "hi");

    field_select_gadget<FieldT> select(env.pb, boolean_value<FieldT>::constant(true), lo, hi, "select");
    select.generate_r1cs_constraints();
    select.generate_r1cs_witness();

    EXPECT_EQ(0u, env.num_constraints());
    EXPECT_EQ(field(22), env.eject(select.result()));
}

TEST(FieldSelect, ConstantBranchesAreLinear) {
    circuit_environment<FieldT> env(1);
    const boolean_value<FieldT> d = env.new_boolean(Public, true, "d");
    const size_t before = env.num_constraints();

    field_select_gadget<FieldT> select(env.pb, d,
                                       field_value<FieldT>::constant(field(3)),
                                       field_value<FieldT>::constant(field(8)), "select");
    select.generate_r1cs_constraints();
    select.generate_r1cs_witness();

    EXPECT_EQ(0u, env.num_constraints() - before);
    EXPECT_EQ(field(8), env.eject(select.result()));
    EXPECT_EQ(Public, select.result().mode);
}

TEST(FieldEquality, PrivateValues) {
    for (long other = 5; other < 7; ++other){
        circuit_environment<FieldT> env;
        const field_value<FieldT> a = env.new_field(Private, field(5), "a");
        const field_value<FieldT> b = env.new_field(Private, field(other), "b");

        field_equality_gadget<FieldT> eq(env.pb, a, b, "eq");
        eq.generate_r1cs_constraints();
        eq.generate_r1cs_witness();

        EXPECT_EQ(2u, env.num_constraints());
        EXPECT_EQ(other == 5, env.eject(eq.result()));
        EXPECT_TRUE(env.is_satisfied());
    }
}

TEST(FieldEquality, CannotClaimEqualityOfDifferentValues) {
    circuit_environment<FieldT> env;
    const field_value<FieldT> a = env.new_field(Private, field(5), "a");
    const field_value<FieldT> b = env.new_field(Private, field(6), "b");

    field_equality_gadget<FieldT> eq(env.pb, a, b, "eq");
    eq.generate_r1cs_constraints();
    eq.generate_r1cs_witness();

    env.pb.val(libsnark::pb_variable<FieldT>(eq.result().lc.terms[0].index)) = FieldT::one();
    EXPECT_FALSE(env.is_satisfied());
}

TEST(FieldEquality, Constants) {
    circuit_environment<FieldT> env;
    field_equality_gadget<FieldT> eq(env.pb, field_value<FieldT>::constant(field(5)),
                                     field_value<FieldT>::constant(field(5)), "eq");
    eq.generate_r1cs_constraints();
    EXPECT_EQ(0u, env.num_constraints());
    EXPECT_TRUE(eq.result().is_constant());
    EXPECT_TRUE(eq.result().constant_value());
}

TEST(BooleanGadgets, TruthTables) {
    for (int a = 0; a < 2; ++a){
        for (int b = 0; b < 2; ++b){
            circuit_environment<FieldT> env;
            const boolean_value<FieldT> x = env.new_boolean(Private, a == 1, "x");
            const boolean_value<FieldT> y = env.new_boolean(Private, b == 1, "y");

            boolean_and_gadget<FieldT> conjunction(env.pb, x, y, "and");
            boolean_or_gadget<FieldT> disjunction(env.pb, x, y, "or");
            conjunction.generate_r1cs_constraints();
            disjunction.generate_r1cs_constraints();
            conjunction.generate_r1cs_witness();
            disjunction.generate_r1cs_witness();

            EXPECT_EQ(a == 1 && b == 1, env.eject(conjunction.result()));
            EXPECT_EQ(a == 1 || b == 1, env.eject(disjunction.result()));
            EXPECT_TRUE(env.is_satisfied());
        }
    }
}

TEST(BooleanGadgets, ConstantOperand) {
    circuit_environment<FieldT> env;
    const boolean_value<FieldT> x = env.new_boolean(Private, false, "x");
    const size_t before = env.num_constraints();

    boolean_or_gadget<FieldT> disjunction(env.pb, x, boolean_value<FieldT>::constant(true), "or");
    disjunction.generate_r1cs_constraints();
    disjunction.generate_r1cs_witness();

    EXPECT_EQ(0u, env.num_constraints() - before);
    EXPECT_TRUE(env.eject(disjunction.result()));
}
