#include <chronicle/fs/file_io.hpp>

#include <cerrno>
#include <cstring>

#include <chronicle/encodings/json.hpp>
#include <chronicle/encodings/yaml.hpp>

namespace chronicle {

static bool
is_yaml_path(file_path const& path)
{
    auto extension = path.extension().string();
    return extension == ".yml" || extension == ".yaml";
}

template<class Stream>
static void
open_stream(Stream& file, file_path const& path, std::ios::openmode mode)
{
    file.open(path.c_str(), mode);
    if (!file)
    {
        CHRONICLE_THROW(
            open_file_error()
            << file_path_info(path) << open_mode_info(mode)
            << internal_error_message_info(std::strerror(errno)));
    }
    file.exceptions(std::ios::failbit | std::ios::badbit);
}

void
open_file(std::ifstream& file, file_path const& path, std::ios::openmode mode)
{
    open_stream(file, path, mode);
}

void
open_file(std::ofstream& file, file_path const& path, std::ios::openmode mode)
{
    open_stream(file, path, mode);
}

string
read_file_contents(file_path const& path)
{
    std::ifstream in;
    open_file(in, path, std::ios::in | std::ios::binary);
    string contents;
    in.seekg(0, std::ios::end);
    contents.resize(static_cast<size_t>(in.tellg()));
    in.seekg(0, std::ios::beg);
    if (!contents.empty())
        in.read(&contents[0], contents.size());
    return contents;
}

void
dump_string_to_file(file_path const& path, string const& contents)
{
    std::ofstream output;
    open_file(
        output, path, std::ios::out | std::ios::trunc | std::ios::binary);
    output << contents;
}

dynamic
read_value_file(file_path const& path)
{
    auto contents = read_file_contents(path);
    try
    {
        if (is_yaml_path(path))
            return parse_yaml_value(contents);
        return parse_json_value(contents);
    }
    catch (boost::exception& e)
    {
        e << file_path_info(path);
        throw;
    }
}

void
write_value_file(file_path const& path, dynamic const& value)
{
    dump_string_to_file(
        path,
        is_yaml_path(path) ? value_to_yaml(value) + "\n"
                           : value_to_json(value) + "\n");
}

} // namespace chronicle
