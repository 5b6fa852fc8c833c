#include <gtest/gtest.h>
#include <cstring>
#include <iostream>

// Assert-based suites
void run_metadata_tests();
void run_expr_tests();
void run_options_tests();
void run_diagnostics_tests();

int main(int argc, char** argv){
    bool listing = false;
    for(int i = 1; i < argc; ++i) if(std::strcmp(argv[i], "--gtest_list_tests") == 0) listing = true;
    if(!listing){
        run_metadata_tests();
        run_expr_tests();
        run_options_tests();
        run_diagnostics_tests();
        std::cout << "All harness tests passed" << std::endl;
    }
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
