#include <batchpress/batchpress.hpp>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

// Precompress all files of a static site: '<file>.gz', '<file>.br' and '<file>.zst' are written next to
// each other under the output directory, mirroring the input tree, ready to be served as is.
int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <input dir> [output dir] [worker threads]\n";
    return EXIT_FAILURE;
  }
  const std::filesystem::path inputDir = argv[1];
  const std::filesystem::path outputDir = argc > 2 ? std::filesystem::path(argv[2]) : inputDir;
  const auto workerThreads = argc > 3 ? static_cast<uint32_t>(std::stoul(argv[3])) : 0U;

  try {
    std::vector<batchpress::CompressionInput> inputs;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(inputDir)) {
      if (entry.is_regular_file()) {
        inputs.push_back(batchpress::CompressionInput::FromFile(entry.path(), inputDir));
      }
    }

    // Files are compressed once and served many times: use the highest levels.
    const auto& registry = batchpress::CodecRegistry::Builtin();
    std::vector<batchpress::AlgorithmSpec> specs;
    for (batchpress::CodecId codec : registry.availableCodecs()) {
      specs.emplace_back(codec, batchpress::GetCodecTraits(codec).maxLevel);
    }
    const batchpress::ItemConfig config{batchpress::AlgorithmSet(specs)};

    batchpress::BatchOptions options;
    options.workerThreads = workerThreads;
    options.skipExtensions = batchpress::PrecompressedExtensionList();
    batchpress::DirectoryTarget target{outputDir};
    target.keepSourceStructure = true;
    target.overwritePolicy = batchpress::OverwritePolicy::Replace;
    options.target = std::move(target);

    const batchpress::BatchCoordinator coordinator(registry);
    const auto result = coordinator.run(inputs, config, options);

    for (const auto& item : result) {
      if (!item.success) {
        std::cerr << item.id << ": " << item.failureReason() << '\n';
      }
    }
    std::cout << batchpress::BatchStats::From(result).summary();
    return result.allSucceeded() ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }
}
