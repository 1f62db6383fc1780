#include <chronicle/fs/file_io.hpp>

#include <chronicle/core/testing.hpp>

using namespace chronicle;

template<class File>
void
test_bad_open_file(std::ios::openmode mode)
{
    file_path path("/very/likely/to-be/bad/file/path/asfqwfa/--test");

    File file;
    try
    {
        open_file(file, path, mode);
        FAIL("no exception thrown");
    }
    catch (open_file_error& e)
    {
        REQUIRE(get_required_error_info<file_path_info>(e) == path);
        REQUIRE(get_required_error_info<open_mode_info>(e) == mode);
        get_required_error_info<internal_error_message_info>(e);
    }
}

TEST_CASE("file open errors", "[fs][file_io]")
{
    test_bad_open_file<std::ifstream>(std::ios::in);
    test_bad_open_file<std::ofstream>(
        std::ios::binary | std::ios::out | std::ios::trunc);
    REQUIRE_THROWS_AS(
        read_file_contents("/very/likely/to-be/bad/file.json"),
        open_file_error);
}

TEST_CASE("file contents", "[fs][file_io]")
{
    file_path path("read_file_contents.txt");
    auto text = "some simple\n  text\n";
    dump_string_to_file(path, text);
    REQUIRE(read_file_contents(path) == text);

    dump_string_to_file(path, "");
    REQUIRE(read_file_contents(path).empty());
    std::filesystem::remove(path);
}

TEST_CASE("value files", "[fs][file_io]")
{
    file_path json_path("value_file.json");
    dump_string_to_file(json_path, "{\"name\": \"post\", \"n\": 2}");
    REQUIRE(
        read_value_file(json_path)
        == dynamic(dynamic_map{{"name", "post"}, {"n", integer(2)}}));

    file_path yaml_path("value_file.yml");
    dump_string_to_file(yaml_path, "name: post\nn: 2\n");
    REQUIRE(
        read_value_file(yaml_path)
        == dynamic(dynamic_map{{"name", "post"}, {"n", integer(2)}}));

    dump_string_to_file(json_path, "{\"name\": ");
    try
    {
        read_value_file(json_path);
        FAIL("no exception thrown");
    }
    catch (parsing_error& e)
    {
        REQUIRE(get_required_error_info<file_path_info>(e) == json_path);
    }

    std::filesystem::remove(json_path);
    std::filesystem::remove(yaml_path);
}

TEST_CASE("writing value files", "[fs][file_io]")
{
    dynamic value = dynamic_map{
        {"title", "post"},
        {"tags", dynamic_array{"a", "b"}},
        {"n", integer(2)}};

    file_path json_path("written_value.json");
    write_value_file(json_path, value);
    REQUIRE(read_file_contents(json_path).front() == '{');
    REQUIRE(read_value_file(json_path) == value);

    file_path yaml_path("written_value.yaml");
    write_value_file(yaml_path, value);
    REQUIRE(read_file_contents(yaml_path).front() != '{');
    REQUIRE(read_value_file(yaml_path) == value);

    std::filesystem::remove(json_path);
    std::filesystem::remove(yaml_path);
}
