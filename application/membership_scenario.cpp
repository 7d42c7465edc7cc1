/** @file
 *****************************************************************************

 Demo application for membership-snark

 Builds a native Merkle tree of 2^depth leaves, picks one leaf and builds the
 membership circuit for it: leaf, authentication path and claimed root are
 allocated with the requested modes, the path can be corrupted on purpose.
 Prints the cost of the circuit, the membership result and whether the
 protoboard is satisfied.

 *****************************************************************************/

#include <iostream>
#include <stdexcept>
#include <string>
#include <boost/program_options.hpp>

#include "libff/common/default_types/ec_pp.hpp"
#include "libff/common/profiling.hpp"

#include "circuit/circuit_environment.hpp"
#include "gadgets/merkle_path_gadget.hpp"
#include "gadgets/utils.h"
#include "native/merkle_tree.hpp"

typedef libff::default_ec_pp EcPP;
typedef libff::Fr<EcPP> SFieldT;

struct ScenarioOptions {
    size_t depth;
    size_t index;
    std::string domain;
    circuit_mode witness_mode;
    bool public_root;
    int corrupt_sibling;
    int flip_direction;
    bool wrong_root;
    bool enforce;
    bool random_leaves;
};

template<typename FieldT>
std::vector<FieldT> make_leaves(size_t count, bool random_leaves){
    std::vector<FieldT> leaves;
    leaves.reserve(count);
    for (size_t i = 0; i < count; ++i){
        leaves.push_back(random_leaves ? FieldT::random_element() : FieldT((long) (i + 1)));
    }
    return leaves;
}

template<typename FieldT>
int run_scenario(const ScenarioOptions &options){
    long long start_time, end_time;

    if (options.depth > native_merkle_tree<FieldT>::max_depth){
        throw std::invalid_argument("--depth " + std::to_string(options.depth) + " exceeds the maximum depth " +
                                    std::to_string(native_merkle_tree<FieldT>::max_depth));
    }

    const std::shared_ptr<const poseidon_parameters<FieldT> > params =
            poseidon_parameters<FieldT>::setup(options.domain, 2);

    libff::enter_block("Build native tree");
    const native_merkle_tree<FieldT> tree(params, options.depth,
                                          make_leaves<FieldT>(size_t(1) << options.depth, options.random_leaves));
    libff::leave_block("Build native tree");

    const FieldT leaf = tree.leaf(options.index);
    MerklePathVals<FieldT> path_vals(tree.authentication_path(options.index));
    FieldT root = tree.root();

    if (options.corrupt_sibling >= 0){
        if ((size_t) options.corrupt_sibling >= path_vals.depth()){
            throw std::invalid_argument("--corrupt-sibling level " + std::to_string(options.corrupt_sibling) + " is not below the tree depth");
        }
        path_vals.siblings[options.corrupt_sibling] += FieldT::one();
    }
    if (options.flip_direction >= 0){
        if ((size_t) options.flip_direction >= path_vals.depth()){
            throw std::invalid_argument("--flip-direction level " + std::to_string(options.flip_direction) + " is not below the tree depth");
        }
        path_vals.directions[options.flip_direction] = !path_vals.directions[options.flip_direction];
    }
    if (options.wrong_root){
        root += FieldT::one();
    }

    const circuit_mode root_mode = options.public_root ? Public : options.witness_mode;
    size_t num_public = root_mode == Public ? 1 : 0;
    if (options.witness_mode == Public){
        num_public += 1 + 2 * options.depth;
    }

    start_time = libff::get_nsec_time();
    libff::enter_block("Build membership circuit");
    circuit_environment<FieldT> env(num_public);
    const field_value<FieldT> claimed_root = env.new_field(root_mode, root, "root");
    const field_value<FieldT> leaf_value = env.new_field(options.witness_mode, leaf, "leaf");
    MerklePathVars<FieldT> path_vars;
    path_vars.allocate(env, options.witness_mode, options.witness_mode, path_vals, "path");

    merkle_path_gadget<FieldT> membership(env.pb, params, options.depth, leaf_value, path_vars.levels, claimed_root, "membership");
    membership.generate_r1cs_constraints();
    if (options.enforce){
        env.assert_true(membership.result(), "membership enforced");
    }
    libff::leave_block("Build membership circuit");

    libff::enter_block("Generate witness");
    membership.generate_r1cs_witness();
    libff::leave_block("Generate witness");
    end_time = libff::get_nsec_time();

    const bool is_member = env.eject(membership.result());
    std::cout << "Tree depth: " << options.depth << ", leaf index: " << options.index << std::endl;
    std::cout << "Root: " << field_to_decimal(root) << std::endl;
    std::cout << "Computed root: " << field_to_decimal(env.eject(membership.computed_root())) << std::endl;
    std::cout << "Counts: " << env.counts() << std::endl;
    std::cout << "Result mode: " << mode_to_string(membership.result().mode) << std::endl;
    std::cout << "Member: " << (is_member ? "true" : "false") << std::endl;
    std::cout << "Satisfied: " << (env.is_satisfied() ? "true" : "false") << std::endl;
    std::cout << "Duration: " << (end_time - start_time) / 1000 << "us" << std::endl;

    return is_member ? 0 : 2;
}

int main(int argc, char *argv[]) {
    namespace po = boost::program_options;
    ScenarioOptions options;
    std::string mode;
    std::cout << "Membership Scenario" << std::endl;
    po::options_description desc("Usage");
    po::variables_map vm;
    desc.add_options()
            ("help", "show help")
            ("depth", po::value<size_t>(&options.depth)->default_value(4), "depth of the Merkle tree")
            ("index", po::value<size_t>(&options.index)->default_value(0), "index of the proven leaf")
            ("domain", po::value<std::string>(&options.domain)->default_value("membership-snark"), "domain separator for the hash parameters")
            ("mode", po::value<std::string>(&mode)->default_value("private"), "mode of leaf and path: constant, public or private")
            ("public-root", "allocate the claimed root as public input")
            ("corrupt-sibling", po::value<int>(&options.corrupt_sibling)->default_value(-1), "add one to the sibling at this level")
            ("flip-direction", po::value<int>(&options.flip_direction)->default_value(-1), "flip the direction bit at this level")
            ("wrong-root", "claim a root that differs from the tree root")
            ("enforce", "assert the membership result in the circuit")
            ("random-leaves", "fill the tree with random leaves instead of 1, 2, 3, ...")
            ("profile", "print profiling information");

    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << e.what() << std::endl << desc << std::endl;
        return 1;
    }

    if (vm.count("help")) {
        std::cout << desc << std::endl;
        return 1;
    }

    options.public_root = vm.count("public-root") > 0;
    options.wrong_root = vm.count("wrong-root") > 0;
    options.enforce = vm.count("enforce") > 0;
    options.random_leaves = vm.count("random-leaves") > 0;

    EcPP::init_public_params();

    if (!vm.count("profile")) {
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
    }

    try {
        options.witness_mode = mode_from_string(mode);
        return run_scenario<SFieldT>(options);
    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
