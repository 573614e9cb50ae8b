#include "errors.hpp"
#include "image_codec.hpp"
#include "test_cases.hpp"

#define STBI_FAILURE_USERMSG
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#ifdef _MSC_VER
namespace std
{
template <class>
struct result_of;
template <class F, class... ArgTypes>
struct result_of<F(ArgTypes...)> : std::invoke_result<F, ArgTypes...>
{
};
} // namespace std
#endif
#include "clipp.h"

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <cstdlib>

namespace
{

enum class Mode
{
    encode,
    decode
};

struct Parameters
{
    Mode mode;
    std::string input_file_name;
    std::string output_file_name;
    int width;
    int height;
    bool ones_complement;
};

void encode(const Parameters &params)
{
    int width {};
    int height {};
    int channels_in_file {};

    struct image_deleter
    {
        void operator()(stbi_uc *pointer)
        {
            stbi_image_free(pointer);
        }
    };
    std::unique_ptr<stbi_uc[], image_deleter> image(
        stbi_load(params.input_file_name.c_str(),
                  &width,
                  &height,
                  &channels_in_file,
                  1));
    if (!image)
    {
        std::ostringstream oss;
        oss << "Unable to read " << std::quoted(params.input_file_name) << ": "
            << stbi_failure_reason();
        throw io_error(oss.str());
    }

    const auto activations = gray_pixels_to_activations(
        image.get(), width, height, params.ones_complement);

    std::ofstream file(params.output_file_name);
    if (!file)
    {
        std::ostringstream oss;
        oss << "Unable to open " << std::quoted(params.output_file_name)
            << " for writing";
        throw io_error(oss.str());
    }
    write_activations(file, activations);
    if (!file)
    {
        std::ostringstream oss;
        oss << "Failed to write " << std::quoted(params.output_file_name);
        throw io_error(oss.str());
    }

    std::cout << "Wrote " << width << " x " << height << " activations to "
              << std::quoted(params.output_file_name) << '\n';
}

void decode(const Parameters &params)
{
    const auto activations = load_case_table(
        params.input_file_name, params.width, params.height);
    const auto pixels =
        activations_to_gray_pixels(activations, params.ones_complement);

    std::cout << "Saving output to " << std::quoted(params.output_file_name)
              << '\n';

    const auto write_result = stbi_write_png(params.output_file_name.c_str(),
                                             params.width,
                                             params.height,
                                             1,
                                             pixels.data(),
                                             params.width);
    if (write_result == 0)
    {
        throw io_error("Failed to store image " + params.output_file_name);
    }
}

[[nodiscard]] Parameters parse_command_line(int argc, char *argv[])
{
    Parameters params {.mode = Mode::encode,
                       .input_file_name = {},
                       .output_file_name = {},
                       .width = 0,
                       .height = 0,
                       .ones_complement = false};

    bool show_help {false};

    const auto files =
        ((clipp::required("-i", "--input") &
          clipp::value(
              clipp::match::prefix_not("-"), "input", params.input_file_name))
             .doc("The input file"),
         (clipp::required("-o", "--output") &
          clipp::value(
              clipp::match::prefix_not("-"), "output", params.output_file_name))
             .doc("The output file"),
         clipp::option("-c", "--complement")
             .set(params.ones_complement)
             .doc("Apply the ones complement (1 - a) to every activation"));

    const auto cli =
        (clipp::option("-h", "--help")
             .set(show_help)
             .doc("Show this message and exit") |
         (clipp::command("encode").set(params.mode, Mode::encode),
          files) |
         (clipp::command("decode").set(params.mode, Mode::decode),
          files,
          (clipp::required("-W", "--width") &
           clipp::value(clipp::match::integers(), "width", params.width))
              .doc("The width of the image"),
          (clipp::required("-H", "--height") &
           clipp::value(clipp::match::integers(), "height", params.height))
              .doc("The height of the image")));

    const auto executable_name =
        std::filesystem::path(argv[0]).filename().string();
    const auto result = clipp::parse(argc, argv, cli);

    if (result.any_error())
    {
        std::cerr << "Usage:\n"
                  << clipp::usage_lines(cli, executable_name) << '\n';
        std::exit(EXIT_FAILURE);
    }

    if (show_help)
    {
        std::cout << clipp::make_man_page(cli, executable_name) << '\n';
        std::exit(EXIT_SUCCESS);
    }

    if (params.mode == Mode::decode && (params.width <= 0 || params.height <= 0))
    {
        std::cerr << "Error on image size of " << params.width << " x "
                  << params.height << ": must be strictly positive\n";
        std::exit(EXIT_FAILURE);
    }

    return params;
}

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        const auto params = parse_command_line(argc, argv);
        switch (params.mode)
        {
        case Mode::encode: encode(params); break;
        case Mode::decode: decode(params); break;
        }
        return EXIT_SUCCESS;
    }
    catch (const std::exception &e)
    {
        std::cerr << e.what() << '\n';
        return EXIT_FAILURE;
    }
}
