#include "modes.hpp"
#include "args.hpp"

#include "rvfstream/core/Config.hpp"
#include "rvfstream/io/PatternSource.hpp"
#include "rvfstream/io/UdpSender.hpp"
#include "rvfstream/protocol/Packetizer.hpp"

#include <iostream>
#include <thread>
#include <chrono>
#include <string>
#include <random>
#include <algorithm>

int run_send(int argc, char** argv) {
    rvfstream::Config cfg{};
    cfg.port          = static_cast<std::uint16_t>(argValueInt(argc, argv, "port", cfg.port));
    cfg.linesPerChunk = argValueInt(argc, argv, "lines", cfg.linesPerChunk);

    const std::string host    = argValue(argc, argv, "host", "127.0.0.1");
    const int fps             = std::max(1, argValueInt(argc, argv, "fps", 30));
    const int maxFrames       = std::max(0, argValueInt(argc, argv, "frames", 0)); // 0 = endless
    const double loss         = std::clamp(argValueDouble(argc, argv, "loss", 0.0), 0.0, 1.0);

    rvfstream::PatternSource::Options po{};
    po.pattern   = argValue(argc, argv, "pattern", "gradient");
    po.imagePath = argValue(argc, argv, "image", "");
    po.seed      = static_cast<unsigned>(std::max(0, argValueInt(argc, argv, "seed", 0)));

    std::cout << "[send] starting…\n";
    std::cout << "[send] target=" << host << ":" << cfg.port << ", fps=" << fps
              << ", lines/chunk=" << cfg.linesPerChunk
              << ", source=" << (po.imagePath.empty() ? po.pattern : po.imagePath)
              << ", loss=" << loss << "\n";

    try {
        rvfstream::PatternSource source(po);
        rvfstream::UdpSender tx(host, cfg.port);
        rvfstream::Packetizer packetizer(cfg.linesPerChunk);

        std::mt19937 rng{std::random_device{}()};
        std::uniform_real_distribution<double> coin(0.0, 1.0);

        const auto frameDelay = std::chrono::microseconds(1'000'000 / fps);
        auto next = std::chrono::steady_clock::now();

        std::uint32_t frameId = 0;
        std::uint64_t skipped = 0;
        int sent = 0;
        while (maxFrames == 0 || sent < maxFrames) {
            auto f = source.next();
            if (!f) break;

            for (const auto& dg : packetizer.packetize(f->data, frameId)) {
                if (loss > 0.0 && coin(rng) < loss) { ++skipped; continue; }
                tx.send(dg);
            }
            ++frameId;

            if ((++sent % fps) == 0) {
                std::cout << "[send] frames: " << sent
                          << "  datagrams: " << tx.sent()
                          << "  failed: " << tx.failed()
                          << "  skipped: " << skipped << "\n";
            }

            next += frameDelay;
            std::this_thread::sleep_until(next);
        }
        std::cout << "[send] finished. frames: " << sent
                  << ", datagrams: " << tx.sent()
                  << ", next seq: " << packetizer.nextSeq() << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[send] error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
