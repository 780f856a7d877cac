/**
 *  @file
 *  @copyright defined in tradesafe/LICENSE.txt
 */
#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <fc/filesystem.hpp>
#include <fc/log/logger.hpp>
#include <fc/exception/exception.hpp>

#include <tradesafe/utilities/tempdir.hpp>

std::string tradesafe_unittests_dir;

CATCH_TRANSLATE_EXCEPTION(fc::exception& e) {
    return e.to_detail_string();
}

int
main(int argc, char* argv[]) {
    tradesafe_unittests_dir = (tradesafe::utilities::temp_directory_path() / "tradesafe_unittests").generic_string();
    if(fc::exists(tradesafe_unittests_dir)) {
        fc::remove_all(tradesafe_unittests_dir);
    }
    fc::logger::get().set_log_level(fc::log_level(fc::log_level::error));

    auto result = Catch::Session().run(argc, argv);

    fc::remove_all(tradesafe_unittests_dir);
    return result;
}
