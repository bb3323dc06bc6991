/// @file main.cpp
/// @brief mmseg_tool：分割串解码 / 渲染 / 提取命令行工具

#include "MmsPipeline.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <array>
#include <charconv>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace
{
	struct Options
	{
		std::string command;
		std::vector<std::string> positional;
		int size = 512;
		uint32_t depth = mms::codec::kMaxDepth;
		int tolerance = mms::paint::kDefaultColorTolerance;
		std::vector<std::string> colors;
		mms::core::LogLevel log_level = mms::core::LogLevel::kWarn;
		// 整张纹理内的默认 UV 三角形
		mms::geom::UvFootprint footprint{{mms::core::Vec2d(0.0, 0.0),
		                                  mms::core::Vec2d(1.0, 0.0),
		                                  mms::core::Vec2d(0.0, 1.0)}};
	};

	void print_usage(const char* prog)
	{
		std::cerr << "MMSeg v" << mms::core::version() << "\n";
		std::cerr << "Usage: " << prog << " <command> [args] [options]\n";
		std::cerr << "\n";
		std::cerr << "Commands:\n";
		std::cerr << "  decode <hex>            Print the tree encoded by a segmentation string\n";
		std::cerr << "  render <hex> <out.png>  Paint a segmentation string into a new texture\n";
		std::cerr << "  extract <in.png>        Extract a segmentation string from a texture\n";
		std::cerr << "\n";
		std::cerr << "Options:\n";
		std::cerr << "  --size N                Texture size for render (default: 512)\n";
		std::cerr << "  --depth N               Maximum tree depth (default: 8)\n";
		std::cerr << "  --tolerance N           Color match tolerance for extract (default: 48)\n";
		std::cerr << "  --colors c0,c1,c2,c3    Palette as #RRGGBB[AA], index 0 is the base color\n";
		std::cerr << "  --footprint u0,v0,u1,v1,u2,v2\n";
		std::cerr << "                          UV triangle (default: 0,0,1,0,0,1)\n";
		std::cerr << "  --log-level LEVEL       trace|debug|info|warn|error|critical|off (default: warn)\n";
	}

	std::vector<std::string> split(std::string_view text, char sep)
	{
		std::vector<std::string> parts;
		size_t start = 0;
		while (start <= text.size())
		{
			const size_t end = std::min(text.find(sep, start), text.size());
			parts.emplace_back(text.substr(start, end - start));
			start = end + 1;
		}
		return parts;
	}

	template <typename T>
	bool parse_number(std::string_view text, T& out)
	{
		const auto* last = text.data() + text.size();
		const auto [ptr, ec] = std::from_chars(text.data(), last, out);
		return ec == std::errc() && ptr == last;
	}

	bool parse_double(const std::string& text, double& out)
	{
		try
		{
			size_t used = 0;
			out = std::stod(text, &used);
			return used == text.size();
		}
		catch (const std::exception&)
		{
			return false;
		}
	}

	bool parse_footprint(std::string_view text, mms::geom::UvFootprint& out)
	{
		const auto parts = split(text, ',');
		if (parts.size() != 6)
		{
			return false;
		}
		std::array<double, 6> c{};
		for (size_t i = 0; i < 6; ++i)
		{
			if (!parse_double(parts[i], c[i]))
			{
				return false;
			}
		}
		for (int i = 0; i < 3; ++i)
		{
			out.v[i] = mms::core::Vec2d(c[2 * i], c[2 * i + 1]);
		}
		return true;
	}

	/// 解析命令行，失败时打印原因并返回 false
	bool parse_args(int argc, char* argv[], Options& opt)
	{
		for (int i = 1; i < argc; ++i)
		{
			const std::string_view arg(argv[i]);
			const bool has_value = i + 1 < argc;
			if (arg.size() > 2 && arg.substr(0, 2) == "--")
			{
				if (!has_value)
				{
					std::cerr << "Error: missing value for " << arg << "\n";
					return false;
				}
				const std::string_view value(argv[++i]);
				bool ok = true;
				if (arg == "--size")
				{
					ok = parse_number(value, opt.size) && opt.size > 0;
				}
				else if (arg == "--depth")
				{
					ok = parse_number(value, opt.depth) && opt.depth <= mms::codec::kMaxDepth;
				}
				else if (arg == "--tolerance")
				{
					ok = parse_number(value, opt.tolerance) && opt.tolerance >= 0;
				}
				else if (arg == "--colors")
				{
					opt.colors = split(value, ',');
				}
				else if (arg == "--footprint")
				{
					ok = parse_footprint(value, opt.footprint);
				}
				else if (arg == "--log-level")
				{
					const auto level = mms::core::Log::parse_level(value);
					ok = level.has_value();
					if (ok)
					{
						opt.log_level = *level;
					}
				}
				else
				{
					std::cerr << "Error: unknown option " << arg << "\n";
					return false;
				}
				if (!ok)
				{
					std::cerr << "Error: invalid value '" << value << "' for " << arg << "\n";
					return false;
				}
				continue;
			}
			if (opt.command.empty())
			{
				opt.command = argv[i];
				continue;
			}
			opt.positional.emplace_back(argv[i]);
		}
		return !opt.command.empty();
	}

	int report(const mms::core::Error& error)
	{
		std::cerr << "Error [" << mms::core::enum_name(error.code) << "]: " << error.message << "\n";
		return 1;
	}

	int run_decode(const Options& opt)
	{
		auto tree = mms::codec::decode(opt.positional[0], opt.depth);
		if (!tree)
		{
			return report(tree.error());
		}
		auto canonical = mms::codec::encode(*tree, opt.depth);
		if (!canonical)
		{
			return report(canonical.error());
		}
		std::cout << mms::codec::to_string(*tree) << "\n";
		std::cout << "depth=" << mms::codec::depth(*tree)
		          << " leaves=" << mms::codec::leaf_count(*tree)
		          << " nodes=" << mms::codec::node_count(*tree)
		          << " canonical=" << *canonical << "\n";
		return 0;
	}

	int run_render(const Options& opt, const mms::paint::Palette& palette)
	{
		auto tree = mms::codec::decode(opt.positional[0], opt.depth);
		if (!tree)
		{
			return report(tree.error());
		}

		cv::Mat image = mms::paint::make_image(opt.size, opt.size, palette.color(mms::codec::kBaseMaterial));
		auto raster = mms::paint::Raster::wrap(image);
		if (!raster)
		{
			return report(raster.error());
		}
		auto gaps = mms::paint::paint(*tree, opt.footprint, *raster, palette);
		if (!gaps)
		{
			return report(gaps.error());
		}
		MMS_INFO("painted {} leaves, {} gap pixels filled", mms::codec::leaf_count(*tree), *gaps);

		cv::Mat bgra;
		cv::cvtColor(image, bgra, cv::COLOR_RGBA2BGRA);
		if (!cv::imwrite(opt.positional[1], bgra))
		{
			std::cerr << "Error: failed to write " << opt.positional[1] << "\n";
			return 1;
		}
		std::cout << opt.positional[1] << "\n";
		return 0;
	}

	int run_extract(const Options& opt, const mms::paint::Palette& palette)
	{
		const cv::Mat input = cv::imread(opt.positional[0], cv::IMREAD_UNCHANGED);
		if (input.empty())
		{
			return report({mms::core::ErrorCode::kFileNotFound, "cannot read image " + opt.positional[0]});
		}
		if (input.depth() != CV_8U)
		{
			return report({mms::core::ErrorCode::kUnsupportedFormat, "only 8-bit images are supported"});
		}

		cv::Mat rgba;
		switch (input.channels())
		{
		case 1: cv::cvtColor(input, rgba, cv::COLOR_GRAY2RGBA); break;
		case 3: cv::cvtColor(input, rgba, cv::COLOR_BGR2RGBA); break;
		case 4: cv::cvtColor(input, rgba, cv::COLOR_BGRA2RGBA); break;
		default:
			return report({mms::core::ErrorCode::kUnsupportedFormat,
			               "unsupported channel count " + std::to_string(input.channels())});
		}
		auto raster = mms::paint::Raster::wrap(rgba);
		if (!raster)
		{
			return report(raster.error());
		}

		mms::paint::ExtractParams params;
		params.max_depth = opt.depth;
		params.color_tolerance = opt.tolerance;
		mms::paint::ExtractStats stats;
		auto tree = mms::paint::extract(opt.footprint, *raster, palette, params, &stats);
		if (!tree)
		{
			return report(tree.error());
		}
		auto hex = mms::codec::encode(*tree, opt.depth);
		if (!hex)
		{
			return report(hex.error());
		}
		MMS_INFO("visited {} nodes, tree depth {}", stats.nodes_visited, mms::codec::depth(*tree));
		if (stats.precision_loss())
		{
			std::cerr << "Warning: " << stats.lossy_leaves << " leaves resolved by majority vote at depth "
			          << opt.depth << "\n";
		}
		std::cout << *hex << "\n";
		return 0;
	}
} // namespace

int main(int argc, char* argv[])
{
	Options opt;
	if (!parse_args(argc, argv, opt))
	{
		print_usage(argv[0]);
		return 1;
	}
	mms::core::Log::init("MMSeg", opt.log_level);

	auto palette = mms::paint::Palette::from_hex(opt.colors);
	if (!palette)
	{
		return report(palette.error());
	}

	if (opt.command == "decode" && opt.positional.size() == 1)
	{
		return run_decode(opt);
	}
	if (opt.command == "render" && opt.positional.size() == 2)
	{
		return run_render(opt, *palette);
	}
	if (opt.command == "extract" && opt.positional.size() == 1)
	{
		return run_extract(opt, *palette);
	}
	print_usage(argv[0]);
	return 1;
}
