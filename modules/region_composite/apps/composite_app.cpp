#include <opencv2/opencv.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "../interface/RegionCompositeAPI.hpp"
#include <shared/utils/Logger.hpp>

using namespace RegionComposite;

struct AppSettings {
    std::string command;
    std::vector<std::string> positional;

    Domain::BoundingBox box;
    bool hasBox = false;

    std::string configFile;
    std::string saveConfigFile;
    std::string contextOutFile;
    bool verbose = false;
    std::string logLevel;
    bool timestamps = true;
    int jpegQuality = 95;

    // Command-line overrides applied on top of the configuration file
    double paddingOverride = -1.0;
    int maxDimensionOverride = 0;
    bool acceptResized = false;
};

void printUsage(const char* programName) {
    std::cout << "Region Composite Application\n";
    std::cout << "Usage:\n";
    std::cout << "  " << programName << " prepare  [options] --box x,y,w,h <image> <crop_output>\n";
    std::cout << "  " << programName
              << " finalize [options] --box x,y,w,h <image> <generated> <output>\n\n";
    std::cout << "Commands:\n";
    std::cout << "  prepare                 Write the resized crop for the image generator and\n";
    std::cout << "                          print the lighting/orientation context\n";
    std::cout << "  finalize                Color-match the generated crop and composite it back\n\n";
    std::cout << "Options:\n";
    std::cout << "  --box x,y,w,h           Normalized detection box (values in [0,1])\n";
    std::cout << "  -c, --config <file>     Load configuration (YAML/XML)\n";
    std::cout << "  --save-config <file>    Write the effective configuration and continue\n";
    std::cout << "  --context-out <file>    Also write the generation context to a file\n";
    std::cout << "  --padding <value>       Box padding fraction (default: 0.30)\n";
    std::cout << "  --max-dimension <px>    Longest generator input side (default: 1536)\n";
    std::cout << "  --accept-resized        Fit generator output of any size to the crop\n";
    std::cout << "  -q, --quality <value>   JPEG quality 1-100 (default: 95)\n";
    std::cout << "  -v, --verbose           Enable verbose output\n";
    std::cout << "  --log-level <level>     debug, info, warn, error or off (default: warn)\n";
    std::cout << "  --no-timestamps         Omit timestamps from log lines\n";
    std::cout << "  -h, --help              Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << programName << " prepare --box 0.4,0.2,0.2,0.6 photo.jpg crop.png\n";
    std::cout << "  " << programName
              << " finalize --box 0.4,0.2,0.2,0.6 photo.jpg generated.png result.jpg\n";
}

bool parseBox(const std::string& text, Domain::BoundingBox& box) {
    std::stringstream stream(text);
    std::string token;
    std::vector<double> values;

    while (std::getline(stream, token, ',')) {
        try {
            values.push_back(std::stod(token));
        } catch (const std::exception&) {
            return false;
        }
    }

    if (values.size() != 4) return false;

    box = Domain::BoundingBox(values[0], values[1], values[2], values[3]);
    return box.isValid();
}

AppSettings parseArguments(int argc, char* argv[]) {
    AppSettings settings;

    auto requireValue = [&](int& i, const std::string& arg) -> std::string {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << arg << " requires a value\n";
            exit(1);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            exit(0);
        } else if (arg == "-v" || arg == "--verbose") {
            settings.verbose = true;
        } else if (arg == "--log-level") {
            settings.logLevel = requireValue(i, arg);
        } else if (arg == "--no-timestamps") {
            settings.timestamps = false;
        } else if (arg == "--box") {
            std::string value = requireValue(i, arg);
            if (!parseBox(value, settings.box)) {
                std::cerr << "Error: invalid box '" << value << "'\n";
                exit(1);
            }
            settings.hasBox = true;
        } else if (arg == "-c" || arg == "--config") {
            settings.configFile = requireValue(i, arg);
        } else if (arg == "--save-config") {
            settings.saveConfigFile = requireValue(i, arg);
        } else if (arg == "--context-out") {
            settings.contextOutFile = requireValue(i, arg);
        } else if (arg == "--padding") {
            settings.paddingOverride = std::stod(requireValue(i, arg));
        } else if (arg == "--max-dimension") {
            settings.maxDimensionOverride = std::stoi(requireValue(i, arg));
        } else if (arg == "--accept-resized") {
            settings.acceptResized = true;
        } else if (arg == "-q" || arg == "--quality") {
            settings.jpegQuality = std::stoi(requireValue(i, arg));
            if (settings.jpegQuality < 1 || settings.jpegQuality > 100) {
                std::cerr << "Error: JPEG quality must be between 1 and 100\n";
                exit(1);
            }
        } else if (arg[0] != '-') {
            if (settings.command.empty()) {
                settings.command = arg;
            } else {
                settings.positional.push_back(arg);
            }
        } else {
            std::cerr << "Error: Unknown option " << arg << "\n";
            exit(1);
        }
    }

    size_t expected = 0;
    if (settings.command == "prepare") {
        expected = 2;
    } else if (settings.command == "finalize") {
        expected = 3;
    } else {
        std::cerr << "Error: Expected command 'prepare' or 'finalize'\n";
        printUsage(argv[0]);
        exit(1);
    }

    if (settings.positional.size() != expected) {
        std::cerr << "Error: '" << settings.command << "' expects " << expected << " paths\n";
        printUsage(argv[0]);
        exit(1);
    }

    if (!settings.hasBox) {
        std::cerr << "Error: --box is required\n";
        exit(1);
    }

    return settings;
}

bool buildConfiguration(const AppSettings& settings, Interface::CompositeConfiguration& config) {
    if (!settings.configFile.empty() && !config.loadFromFile(settings.configFile)) {
        std::cerr << "Error: Failed to load configuration " << settings.configFile << "\n";
        return false;
    }

    if (settings.paddingOverride >= 0.0) {
        config.geometry.paddingFraction = settings.paddingOverride;
    }
    if (settings.maxDimensionOverride > 0) {
        config.resize.maxDimension = settings.maxDimensionOverride;
    }
    if (settings.acceptResized) {
        config.acceptResizedGeneratorOutput = true;
    }

    std::string validationError = config.getValidationError();
    if (!validationError.empty()) {
        std::cerr << "Error: Invalid configuration: " << validationError << "\n";
        return false;
    }

    if (!settings.saveConfigFile.empty() && !config.saveToFile(settings.saveConfigFile)) {
        std::cerr << "Error: Failed to save configuration " << settings.saveConfigFile << "\n";
        return false;
    }

    return true;
}

std::vector<int> saveParamsFor(const std::string& path, int jpegQuality) {
    std::string extension = std::filesystem::path(path).extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(), ::tolower);

    if (extension == ".jpg" || extension == ".jpeg") {
        return {cv::IMWRITE_JPEG_QUALITY, jpegQuality};
    }
    if (extension == ".png") {
        return {cv::IMWRITE_PNG_COMPRESSION, 1};
    }
    return {};
}

cv::Mat loadImage(const std::string& path) {
    cv::Mat image = SimpleAPI::loadImage(path);
    if (image.empty()) {
        std::cerr << "Error: Cannot load image " << path << "\n";
    }
    return image;
}

bool runPrepare(const AppSettings& settings, const Interface::CompositeConfiguration& config) {
    cv::Mat original = loadImage(settings.positional[0]);
    if (original.empty()) return false;

    std::cout << "Input image: " << original.cols << "x" << original.rows << " pixels\n";

    auto compositor = Interface::createRegionCompositor(config);
    Domain::PreparedRegion prepared = compositor->prepare(original, settings.box);

    if (!prepared.success) {
        std::cerr << "Error: Region preparation failed (" << Types::toString(prepared.error)
                  << ")\n";
        std::cerr << "Reason: " << prepared.errorMessage << "\n";
        return false;
    }

    std::cout << "Expanded box: " << prepared.expandedBox.toString() << "\n";
    std::cout << "Crop: " << prepared.cropRect.width << "x" << prepared.cropRect.height << " at "
              << prepared.cropRect.x << "," << prepared.cropRect.y << "\n";
    std::cout << "Generator input: " << prepared.generatorInput.cols << "x"
              << prepared.generatorInput.rows << "\n";
    std::cout << "Lighting: " << prepared.lighting.diagnostics() << "\n";
    std::cout << "Context: " << prepared.generationContext << "\n";

    const std::string& cropPath = settings.positional[1];
    if (!cv::imwrite(cropPath, prepared.generatorInput, saveParamsFor(cropPath, settings.jpegQuality))) {
        std::cerr << "Error: Failed to save crop " << cropPath << "\n";
        return false;
    }
    std::cout << "Generator input saved: " << cropPath << "\n";

    if (!settings.contextOutFile.empty()) {
        std::ofstream contextFile(settings.contextOutFile);
        if (!contextFile) {
            std::cerr << "Error: Cannot write context file " << settings.contextOutFile << "\n";
            return false;
        }
        contextFile << prepared.generationContext << "\n";
    }

    return true;
}

bool runFinalize(const AppSettings& settings, const Interface::CompositeConfiguration& config) {
    cv::Mat original = loadImage(settings.positional[0]);
    if (original.empty()) return false;

    cv::Mat generated = loadImage(settings.positional[1]);
    if (generated.empty()) return false;

    auto compositor = Interface::createRegionCompositor(config);

    Domain::PreparedRegion prepared = compositor->prepare(original, settings.box);
    if (!prepared.success) {
        std::cerr << "Error: Region preparation failed: " << prepared.errorMessage << "\n";
        return false;
    }

    Domain::CompositeResult result = compositor->finalize(original, prepared, generated);
    if (!result.success) {
        std::cerr << "Error: Compositing failed (" << Types::toString(result.error) << ")\n";
        std::cerr << "Reason: " << result.errorMessage << "\n";
        return false;
    }

    std::cout << result.getSummary() << "\n";

    const std::string& outputPath = settings.positional[2];
    if (!cv::imwrite(outputPath, result.compositedImage,
                     saveParamsFor(outputPath, settings.jpegQuality))) {
        std::cerr << "Error: Failed to save composite " << outputPath << "\n";
        return false;
    }

    std::cout << "Composite saved: " << outputPath << "\n";
    return true;
}

int main(int argc, char* argv[]) {
    try {
        AppSettings settings = parseArguments(argc, argv);

        Shared::Logger& logger = Shared::Logger::getInstance();
        if (settings.verbose) {
            logger.setLevel(Shared::LogLevel::DEBUG);
        } else {
            logger.setLevel(Shared::Logger::parseLevel(settings.logLevel, Shared::LogLevel::WARN));
        }
        logger.setTimestampsEnabled(settings.timestamps);

        std::cout << "Region Composite " << VERSION_STRING << "\n";
        std::cout << "Command: " << settings.command << "\n";
        std::cout << "Box: " << settings.box.toString() << "\n\n";

        Interface::CompositeConfiguration config;
        if (!buildConfiguration(settings, config)) {
            return 1;
        }

        bool success = settings.command == "prepare" ? runPrepare(settings, config)
                                                     : runFinalize(settings, config);

        return success ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
