#include <gtest/gtest.h>

#include <stdexcept>

#include "circuit/circuit_environment.hpp"
#include "circuit/measurement.hpp"
#include "gadgets/poseidon_crh_gadget.hpp"
#include "native/poseidon_hash.hpp"

#include "utiltest.h"

TEST(PoseidonParameters, Setup) {
    const std::shared_ptr<const poseidon_parameters<FieldT> > params = test_parameters(2);
    EXPECT_EQ(2u, params->arity);
    EXPECT_EQ(3u, params->width);
    EXPECT_EQ(5u, params->alpha);
    EXPECT_EQ(8u, params->full_rounds);
    EXPECT_EQ(57u, params->partial_rounds);
    EXPECT_EQ(3u * 65u, params->round_constants.size());
    EXPECT_TRUE(params->is_full_round(0));
    EXPECT_TRUE(params->is_full_round(3));
    EXPECT_FALSE(params->is_full_round(4));
    EXPECT_FALSE(params->is_full_round(60));
    EXPECT_TRUE(params->is_full_round(61));
}

TEST(PoseidonParameters, DomainSeparation) {
    const std::shared_ptr<const poseidon_parameters<FieldT> > a = poseidon_parameters<FieldT>::setup("domain a", 2);
    const std::shared_ptr<const poseidon_parameters<FieldT> > b = poseidon_parameters<FieldT>::setup("domain b", 2);
    const std::shared_ptr<const poseidon_parameters<FieldT> > a_again = poseidon_parameters<FieldT>::setup("domain a", 2);

    EXPECT_TRUE(a->round_constants == a_again->round_constants);
    EXPECT_FALSE(a->round_constants == b->round_constants);
    EXPECT_NE(poseidon_crh(*a, {field(1), field(2)}), poseidon_crh(*b, {field(1), field(2)}));
}

TEST(PoseidonParameters, SetupRejectsMalformedParameters) {
    EXPECT_THROW(poseidon_parameters<FieldT>::setup("even alpha", 2, 4, 8, 57), std::invalid_argument);
    EXPECT_THROW(poseidon_parameters<FieldT>::setup("odd rounds", 2, 5, 7, 57), std::invalid_argument);
    EXPECT_THROW(poseidon_parameters<FieldT>::setup("no inputs", 0, 5, 8, 57), std::invalid_argument);

    const std::shared_ptr<const poseidon_parameters<FieldT> > params =
            poseidon_parameters<FieldT>::setup("after failure", 2, 5, 8, 57);
    EXPECT_EQ(3u, params->width);
}

TEST(PoseidonParameters, RecommendedPartialRounds) {
    EXPECT_EQ(56u, recommended_partial_rounds(2));
    EXPECT_EQ(57u, recommended_partial_rounds(3));
    EXPECT_EQ(68u, recommended_partial_rounds(17));
    EXPECT_THROW(recommended_partial_rounds(1), std::invalid_argument);
    EXPECT_THROW(recommended_partial_rounds(18), std::invalid_argument);
}

TEST(PoseidonParameters, RejectsMalformedParameters) {
    const std::shared_ptr<const poseidon_parameters<FieldT> > p = test_parameters(2);
    const std::vector<FieldT> &rc = p->round_constants;
    const std::vector<std::vector<FieldT> > &mds = p->mds;

    EXPECT_NO_THROW(poseidon_parameters<FieldT>("ok", 2, 5, 8, 57, rc, mds));
    EXPECT_THROW(poseidon_parameters<FieldT>("arity", 0, 5, 8, 57, rc, mds), std::invalid_argument);
    EXPECT_THROW(poseidon_parameters<FieldT>("alpha", 2, 4, 8, 57, rc, mds), std::invalid_argument);
    EXPECT_THROW(poseidon_parameters<FieldT>("alpha", 2, 1, 8, 57, rc, mds), std::invalid_argument);
    EXPECT_THROW(poseidon_parameters<FieldT>("rounds", 2, 5, 7, 58, rc, mds), std::invalid_argument);

    std::vector<FieldT> short_rc(rc.begin(), rc.end() - 1);
    EXPECT_THROW(poseidon_parameters<FieldT>("constants", 2, 5, 8, 57, short_rc, mds), std::invalid_argument);

    std::vector<std::vector<FieldT> > narrow(mds);
    narrow[1].pop_back();
    EXPECT_THROW(poseidon_parameters<FieldT>("mds", 2, 5, 8, 57, rc, narrow), std::invalid_argument);

    std::vector<std::vector<FieldT> > singular(3, std::vector<FieldT>(3, FieldT::one()));
    EXPECT_THROW(poseidon_parameters<FieldT>("mds", 2, 5, 8, 57, rc, singular), std::invalid_argument);
}

TEST(PoseidonNative, ArityMismatch) {
    const std::shared_ptr<const poseidon_parameters<FieldT> > params = test_parameters(2);
    EXPECT_THROW(poseidon_crh(*params, {field(1)}), arity_mismatch);
    EXPECT_THROW(poseidon_crh(*params, {field(1), field(2), field(3)}), std::invalid_argument);

    std::vector<FieldT> state(2);
    EXPECT_THROW(poseidon_permutation(*params, state), arity_mismatch);
}

TEST(PoseidonNative, SpongePadding) {
    const std::shared_ptr<const poseidon_parameters<FieldT> > params = test_parameters(2);
    EXPECT_NE(poseidon_sponge(*params, std::vector<FieldT>()), poseidon_sponge(*params, {FieldT::zero()}));
    EXPECT_NE(poseidon_sponge(*params, {field(1)}), poseidon_sponge(*params, {field(1), FieldT::zero()}));
    EXPECT_NE(poseidon_sponge(*params, {field(1), field(2)}), poseidon_crh(*params, {field(1), field(2)}));

    const std::vector<int> padded = pad_sponge_input(std::vector<int>({7, 8, 9}), 2, 1, 0);
    EXPECT_EQ(std::vector<int>({7, 8, 9, 1}), padded);
    EXPECT_EQ(std::vector<int>({7, 8, 1, 0}), pad_sponge_input(std::vector<int>({7, 8}), 2, 1, 0));
}

TEST(PoseidonGadget, MatchesNative) {
    for (size_t arity = 1; arity <= 4; ++arity){
        const std::shared_ptr<const poseidon_parameters<FieldT> > params = test_parameters(arity);
        circuit_environment<FieldT> env;
        std::vector<FieldT> values;
        std::vector<field_value<FieldT> > inputs;
        for (size_t i = 0; i < arity; ++i){
            values.push_back(FieldT::random_element());
            inputs.push_back(env.new_field(Private, values.back(), "input"));
        }

        const field_value<FieldT> digest = crh_hash(env.pb, params, inputs);
        EXPECT_EQ(poseidon_crh(*params, values), env.eject(digest));
        EXPECT_EQ(Private, digest.mode);
        EXPECT_TRUE(env.is_satisfied());
    }
}

TEST(PoseidonGadget, ConstantInputsCostNothing) {
    const std::shared_ptr<const poseidon_parameters<FieldT> > params = test_parameters(2);
    circuit_environment<FieldT> env;
    const field_value<FieldT> a = env.new_field(Constant, field(3), "a");
    const field_value<FieldT> b = env.new_field(Constant, field(4), "b");

    const field_value<FieldT> digest = crh_hash(env.pb, params, {a, b});
    EXPECT_EQ(0u, env.num_constraints());
    EXPECT_EQ(0u, env.num_private());
    EXPECT_EQ(Constant, digest.mode);
    EXPECT_TRUE(digest.is_constant());
    EXPECT_EQ(poseidon_crh(*params, {field(3), field(4)}), digest.constant_value());
}

TEST(PoseidonGadget, ConstraintCount) {
    const std::shared_ptr<const poseidon_parameters<FieldT> > params = test_parameters(2);

    circuit_environment<FieldT> env;
    const field_value<FieldT> a = env.new_field(Private, field(3), "a");
    const field_value<FieldT> b = env.new_field(Private, field(4), "b");
    circuit_counts before = env.counts();
    crh_hash(env.pb, params, {a, b});
    const circuit_counts cost = env.counts() - before;
    // 3 multiplications per S-box, the capacity element is constant in the first round
    EXPECT_TRUE(measurement<size_t>::exact(3 * (8 * 3 + 57) - 3).matches(cost.num_constraints));
    EXPECT_EQ(cost.num_constraints, cost.num_private);

    // only b is a variable in the first round
    before = env.counts();
    const field_value<FieldT> mixed = crh_hash(env.pb, params, {field_value<FieldT>::constant(field(5)), b});
    EXPECT_TRUE(measurement<size_t>::exact(3 * (8 * 3 + 57) - 6).matches(env.counts().num_constraints - before.num_constraints));
    EXPECT_EQ(poseidon_crh(*params, {field(5), field(4)}), env.eject(mixed));
    EXPECT_TRUE(env.is_satisfied());
}

TEST(PoseidonGadget, ModePropagation) {
    const std::shared_ptr<const poseidon_parameters<FieldT> > params = test_parameters(2);
    circuit_environment<FieldT> env(2);
    const field_value<FieldT> p = env.new_field(Public, field(1), "p");
    const field_value<FieldT> q = env.new_field(Public, field(2), "q");
    const field_value<FieldT> s = env.new_field(Private, field(3), "s");
    const field_value<FieldT> c = env.new_field(Constant, field(4), "c");

    const field_value<FieldT> pq = crh_hash(env.pb, params, {p, q});
    const field_value<FieldT> pc = crh_hash(env.pb, params, {p, c});
    const field_value<FieldT> ps = crh_hash(env.pb, params, {p, s});
    const field_value<FieldT> cs = crh_hash(env.pb, params, {c, s});

    EXPECT_EQ(Public, pq.mode);
    EXPECT_EQ(Public, pc.mode);
    EXPECT_EQ(Private, ps.mode);
    EXPECT_EQ(Private, cs.mode);

    EXPECT_EQ(poseidon_crh(*params, {field(1), field(2)}), env.eject(pq));
    EXPECT_EQ(poseidon_crh(*params, {field(1), field(4)}), env.eject(pc));
    EXPECT_EQ(poseidon_crh(*params, {field(1), field(3)}), env.eject(ps));
    EXPECT_EQ(poseidon_crh(*params, {field(4), field(3)}), env.eject(cs));
    EXPECT_TRUE(env.is_satisfied());
}

TEST(PoseidonGadget, MixedModesMatchNative) {
    const circuit_mode modes[] = {Constant, Public, Private};
    for (size_t arity = 1; arity <= 3; ++arity){
        const std::shared_ptr<const poseidon_parameters<FieldT> > params = test_parameters(arity);
        // every assignment of modes to the inputs
        size_t combinations = 1;
        for (size_t i = 0; i < arity; ++i){
            combinations *= 3;
        }
        for (size_t combination = 0; combination < combinations; ++combination){
            circuit_environment<FieldT> env(arity);
            std::vector<FieldT> values;
            std::vector<field_value<FieldT> > inputs;
            std::vector<circuit_mode> input_modes;
            size_t digits = combination;
            for (size_t i = 0; i < arity; ++i){
                input_modes.push_back(modes[digits % 3]);
                digits /= 3;
                values.push_back(FieldT::random_element());
                inputs.push_back(env.new_field(input_modes.back(), values.back(), "input"));
            }

            const field_value<FieldT> digest = crh_hash(env.pb, params, inputs);
            EXPECT_EQ(poseidon_crh(*params, values), env.eject(digest));
            EXPECT_EQ(combine_modes(input_modes), digest.mode);
            EXPECT_TRUE(env.is_satisfied());

            const field_value<FieldT> sponge = sponge_hash(env.pb, params, inputs);
            EXPECT_EQ(poseidon_sponge(*params, values), env.eject(sponge));
            EXPECT_TRUE(env.is_satisfied());
        }
    }
}

TEST(PoseidonGadget, ArityMismatch) {
    const std::shared_ptr<const poseidon_parameters<FieldT> > params = test_parameters(2);
    circuit_environment<FieldT> env;
    const field_value<FieldT> a = env.new_field(Private, field(1), "a");

    EXPECT_THROW(poseidon_crh_gadget<FieldT>(env.pb, params, {a}, "crh"), arity_mismatch);
    EXPECT_THROW(poseidon_crh_gadget<FieldT>(env.pb, params, {a, a, a}, "crh"), arity_mismatch);
    EXPECT_THROW(poseidon_crh_gadget<FieldT>(env.pb, nullptr, {a, a}, "crh"), std::invalid_argument);

    try {
        poseidon_crh_gadget<FieldT> crh(env.pb, params, {a}, "crh");
        FAIL() << "expected arity_mismatch";
    } catch (const arity_mismatch &e) {
        EXPECT_EQ(2u, e.expected);
        EXPECT_EQ(1u, e.actual);
    }
}

TEST(PoseidonGadget, TamperedWitnessIsUnsatisfied) {
    const std::shared_ptr<const poseidon_parameters<FieldT> > params = test_parameters(2);
    circuit_environment<FieldT> env;
    const field_value<FieldT> a = env.new_field(Private, field(1), "a");
    const field_value<FieldT> b = env.new_field(Private, field(2), "b");

    crh_hash(env.pb, params, {a, b});
    ASSERT_TRUE(env.is_satisfied());

    const libsnark::pb_variable<FieldT> last(env.pb.num_variables());
    env.pb.val(last) += FieldT::one();
    EXPECT_FALSE(env.is_satisfied());
}

TEST(PoseidonSpongeGadget, MatchesNative) {
    const std::shared_ptr<const poseidon_parameters<FieldT> > params = test_parameters(2);
    for (size_t length = 0; length <= 5; ++length){
        circuit_environment<FieldT> env;
        std::vector<FieldT> values;
        std::vector<field_value<FieldT> > inputs;
        for (size_t i = 0; i < length; ++i){
            values.push_back(field((long) (i * 17 + 3)));
            inputs.push_back(env.new_field(Private, values.back(), "input"));
        }

        const field_value<FieldT> digest = sponge_hash(env.pb, params, inputs);
        EXPECT_EQ(poseidon_sponge(*params, values), env.eject(digest));
        EXPECT_TRUE(env.is_satisfied());
        EXPECT_EQ(length == 0 ? Constant : Private, digest.mode);
    }
}

TEST(PoseidonSpongeGadget, ConstantInputsCostNothing) {
    const std::shared_ptr<const poseidon_parameters<FieldT> > params = test_parameters(3);
    circuit_environment<FieldT> env;
    std::vector<field_value<FieldT> > inputs;
    std::vector<FieldT> values;
    for (long i = 0; i < 7; ++i){
        values.push_back(field(i));
        inputs.push_back(field_value<FieldT>::constant(field(i)));
    }

    const field_value<FieldT> digest = sponge_hash(env.pb, params, inputs);
    EXPECT_EQ(0u, env.num_constraints());
    EXPECT_EQ(Constant, digest.mode);
    EXPECT_EQ(poseidon_sponge(*params, values), digest.constant_value());
}
