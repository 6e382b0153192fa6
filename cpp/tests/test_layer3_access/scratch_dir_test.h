// tests/test_layer3_access/scratch_dir_test.h
#pragma once
/**
 * @file scratch_dir_test.h
 * @brief IsolatedProcessTest with a private scratch directory for HDF5 files.
 */
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <filesystem>
#include <string>
#include <system_error>

namespace h5share::tests
{

class ScratchDirTest : public IsolatedProcessTest
{
  protected:
    void SetUp() override
    {
        IsolatedProcessTest::SetUp();
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        const std::string stem = std::string(info->test_suite_name()) + "_" + info->name();
        dir_ = helper::unique_temp_path(stem.c_str(), "");
        std::error_code ec;
        std::filesystem::create_directories(dir_, ec);
        ASSERT_FALSE(ec) << "cannot create " << dir_ << ": " << ec.message();
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string Dir() const { return dir_.string(); }

    std::string PathIn(const char *name) const { return (dir_ / name).string(); }

  private:
    std::filesystem::path dir_;
};

} // namespace h5share::tests
