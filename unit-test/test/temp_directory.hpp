#pragma once

#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <filesystem>
#include <string>
#include "common/io_utils.hpp"

/**
 * @brief 测试用的临时目录，析构时删除
 */
struct temp_directory {
    std::filesystem::path path;

    temp_directory()
        : path(std::filesystem::temp_directory_path() / ("autograder-test-" + boost::uuids::to_string(boost::uuids::random_generator()()))) {
        std::filesystem::create_directories(path);
    }

    ~temp_directory() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    temp_directory(const temp_directory &) = delete;
    temp_directory &operator=(const temp_directory &) = delete;

    /**
     * @brief 在临时目录中创建文件，自动创建父目录
     */
    std::filesystem::path write(const std::filesystem::path &relative, const std::string &content) const {
        std::filesystem::path file = path / relative;
        std::filesystem::create_directories(file.parent_path());
        grader::write_file_content(file, content);
        return file;
    }
};
