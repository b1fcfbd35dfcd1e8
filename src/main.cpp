#include "edl/EDLDecoder.h"
#include "edl/EDLEncoder.h"
#include "edl/TimelineJson.h"
#include "utils/Logger.h"

#include <cstdlib>
#include <iostream>
#include <fstream>
#include <optional>
#include <string>

void printUsage(const char* programName) {
	std::cout << "Usage: " << programName << " <command> <input> <output> [options]\n";
	std::cout << "\nCommands:\n";
	std::cout << "  decode                   CMX 3600 EDL -> timeline JSON\n";
	std::cout << "  encode                   timeline JSON -> CMX 3600 EDL\n";
	std::cout << "  convert                  CMX 3600 EDL -> CMX 3600 EDL (normalize)\n";
	std::cout << "\nUse - as input or output for stdin/stdout.\n";
	std::cout << "\nOptions:\n";
	std::cout << "  -r, --rate <fps>         Frame rate for decoding and encoding (default: 24)\n";
	std::cout << "  --decode-rate <fps>      Frame rate used to read timecodes\n";
	std::cout << "  --encode-rate <fps>      Frame rate used to write timecodes\n";
	std::cout << "  --reel-length <n>        Maximum reel name length, 0 for unlimited (default: 8)\n";
	std::cout << "  --style <style>          Output style: avid, nucoda, premiere (default: avid)\n";
	std::cout << "  --ignore-tc-mismatch     Tolerate source/record duration mismatches\n";
	std::cout << "  --log-level <level>      error, warn, info or debug (default: info)\n";
	std::cout << "  -v, --verbose            Enable verbose logging\n";
	std::cout << "  -q, --quiet              Suppress all non-error output\n";
	std::cout << "  -h, --help               Show this help message\n";
	std::cout << "\nExamples:\n";
	std::cout << "  " << programName << " decode cut.edl cut.otio\n";
	std::cout << "  " << programName << " encode cut.otio cut.edl --rate 25 --reel-length 0\n";
	std::cout << "  " << programName << " convert in.edl - --decode-rate 29.97 --encode-rate 29.97\n";
}

struct Options {
	std::string command;
	std::string inputFile;
	std::string outputFile;
	edl::EDLDecoder::Config decoder;
	edl::EDLEncoder::Config encoder;
	std::optional<utils::Logger::Level> logLevel;
	bool verbose = false;
	bool quiet = false;
};

double parseRate(const std::string& value) {
	double rate = 0.0;
	try {
		rate = std::stod(value);
	} catch (const std::invalid_argument& e) {
		std::cerr << "Error: Invalid frame rate: " << value << "\n";
		std::exit(1);
	} catch (const std::out_of_range& e) {
		std::cerr << "Error: Frame rate out of range: " << value << "\n";
		std::exit(1);
	}
	if (rate <= 0.0) {
		std::cerr << "Error: Frame rate must be positive: " << value << "\n";
		std::exit(1);
	}
	return rate;
}

Options parseCommandLine(int argc, char* argv[]) {
	Options opts;

	for (int i = 1; i < argc; ++i) {
		std::string arg = argv[i];
		if (arg == "-h" || arg == "--help") {
			printUsage(argv[0]);
			std::exit(0);
		}
	}

	if (argc < 4) {
		printUsage(argv[0]);
		std::exit(1);
	}

	opts.command = argv[1];
	opts.inputFile = argv[2];
	opts.outputFile = argv[3];

	if (opts.command != "decode" && opts.command != "encode" && opts.command != "convert") {
		std::cerr << "Unknown command: " << opts.command << "\n";
		printUsage(argv[0]);
		std::exit(1);
	}

	for (int i = 4; i < argc; ++i) {
		std::string arg = argv[i];

		if (arg == "-v" || arg == "--verbose") {
			opts.verbose = true;
		} else if (arg == "-q" || arg == "--quiet") {
			opts.quiet = true;
		} else if ((arg == "-r" || arg == "--rate") && i + 1 < argc) {
			double rate = parseRate(argv[++i]);
			opts.decoder.rate = rate;
			opts.encoder.rate = rate;
		} else if (arg == "--decode-rate" && i + 1 < argc) {
			opts.decoder.rate = parseRate(argv[++i]);
		} else if (arg == "--encode-rate" && i + 1 < argc) {
			opts.encoder.rate = parseRate(argv[++i]);
		} else if (arg == "--reel-length" && i + 1 < argc) {
			try {
				opts.encoder.reelNameLength = std::stoi(argv[++i]);
			} catch (const std::invalid_argument& e) {
				std::cerr << "Error: Invalid reel name length: " << argv[i] << "\n";
				std::exit(1);
			} catch (const std::out_of_range& e) {
				std::cerr << "Error: Reel name length out of range: " << argv[i] << "\n";
				std::exit(1);
			}
		} else if (arg == "--style" && i + 1 < argc) {
			auto style = edl::outputStyleFromString(argv[++i]);
			if (!style) {
				std::cerr << "Error: Unknown output style: " << argv[i] << "\n";
				std::exit(1);
			}
			opts.encoder.style = *style;
		} else if (arg == "--log-level" && i + 1 < argc) {
			opts.logLevel = utils::Logger::levelFromString(argv[++i]);
			if (!opts.logLevel) {
				std::cerr << "Error: Unknown log level: " << argv[i] << "\n";
				std::exit(1);
			}
		} else if (arg == "--ignore-tc-mismatch") {
			opts.decoder.ignoreTimecodeMismatch = true;
		} else {
			std::cerr << "Unknown option: " << arg << "\n";
			printUsage(argv[0]);
			std::exit(1);
		}
	}

	return opts;
}

edl::TimelinePtr decodeInput(const Options& opts) {
	edl::EDLDecoder decoder(opts.decoder);
	edl::TimelinePtr result = opts.inputFile == "-"
		? decoder.decode(std::cin)
		: decoder.decodeFile(opts.inputFile);

	if (!decoder.frameCountMode().empty()) {
		utils::Logger::debug("FCM: {}", decoder.frameCountMode());
	}
	return result;
}

void writeEDL(const Options& opts, const edl::TimelinePtr& tl) {
	edl::EDLEncoder encoder(opts.encoder);
	if (opts.outputFile == "-") {
		encoder.encode(tl, std::cout);
	} else {
		encoder.encodeFile(tl, opts.outputFile);
	}
}

int main(int argc, char* argv[]) {
	try {
		Options opts = parseCommandLine(argc, argv);

		// Set logging level
		if (opts.logLevel) {
			utils::Logger::setLevel(*opts.logLevel);
		} else if (opts.quiet) {
			utils::Logger::setLevel(utils::Logger::ERROR);
		} else if (opts.verbose) {
			utils::Logger::setLevel(utils::Logger::DEBUG);
		} else {
			utils::Logger::setLevel(utils::Logger::INFO);
		}

		if (opts.command == "decode") {
			utils::Logger::info("Decoding EDL: {}", opts.inputFile);
			edl::TimelinePtr tl = decodeInput(opts);
			if (opts.outputFile == "-") {
				std::cout << edl::TimelineJson::toString(tl) << std::endl;
			} else {
				edl::TimelineJson::write(tl, opts.outputFile);
			}
		} else if (opts.command == "encode") {
			utils::Logger::info("Encoding timeline: {}", opts.inputFile);
			edl::TimelinePtr tl = opts.inputFile == "-"
				? edl::TimelineJson::parse(std::cin)
				: edl::TimelineJson::read(opts.inputFile);
			writeEDL(opts, tl);
		} else {
			utils::Logger::info("Converting EDL: {}", opts.inputFile);
			edl::TimelinePtr tl = decodeInput(opts);
			writeEDL(opts, tl);
		}

		if (opts.outputFile != "-") {
			utils::Logger::info("Wrote {}", opts.outputFile);
		}
		return 0;

	} catch (const std::exception& e) {
		utils::Logger::error("Error: {}", e.what());
		return 1;
	}
}
