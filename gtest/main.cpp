#include <gtest/gtest.h>

#include "libff/common/default_types/ec_pp.hpp"
#include "libff/common/profiling.hpp"

int main(int argc, char **argv) {
    libff::inhibit_profiling_info = true;
    libff::inhibit_profiling_counters = true;
    libff::default_ec_pp::init_public_params();

    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
