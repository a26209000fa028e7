#include <batchpress/batchpress.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <span>
#include <string>
#include <utility>

// Compress a text in memory with every available codec, then pick the representation to send for an
// Accept-Encoding header given on the command line.
int main(int argc, char** argv) {
  const std::string acceptEncoding = argc > 1 ? argv[1] : "br;q=1.0, gzip;q=0.8, *;q=0.1";

  try {
    const auto& registry = batchpress::CodecRegistry::Builtin();
    const auto available = registry.availableCodecs();

    std::string body;
    for (int lineNb = 0; lineNb < 200; ++lineNb) {
      body.append("<li class=\"item\">batchpress compresses static assets ahead of time</li>\n");
    }
    const auto input = batchpress::CompressionInput::FromBuffer("index.html", std::move(body));

    const batchpress::BatchCoordinator coordinator(registry);
    const auto result = coordinator.run(std::span<const batchpress::CompressionInput>(&input, 1),
                                        batchpress::ItemConfig(batchpress::AlgorithmSet::Defaults()),
                                        batchpress::BatchOptions{});
    const auto& item = result[0];

    const batchpress::EncodingSelector selector(available);
    const auto negotiated = selector.negotiate(acceptEncoding);
    if (negotiated.reject) {
      std::cout << "Accept-Encoding '" << acceptEncoding << "' rejects every representation: 406\n";
      return EXIT_SUCCESS;
    }
    if (!negotiated.codec) {
      std::cout << "Sending identity: " << item.originalSize << " bytes\n";
      return EXIT_SUCCESS;
    }
    const auto* outcome = item.find(*negotiated.codec);
    if (outcome == nullptr || !outcome->ok()) {
      std::cout << "Sending identity, " << batchpress::CodecName(*negotiated.codec) << " output is missing: "
                << item.failureReason() << '\n';
      return EXIT_SUCCESS;
    }
    std::cout << "Content-Encoding: " << batchpress::CodecToken(*negotiated.codec) << ", " << outcome->compressedSize
              << " bytes instead of " << item.originalSize << '\n';
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << '\n';
    return EXIT_FAILURE;
  }

  return 0;
}
