#include "modes.hpp"
#include "args.hpp"
#include "utils.hpp"

#include "rvfstream/io/Recorder.hpp"
#include "rvfstream/io/UdpSender.hpp"
#include "rvfstream/protocol/Packetizer.hpp"

#include <filesystem>
#include <vector>
#include <string>
#include <algorithm>
#include <chrono>
#include <thread>
#include <iostream>

int run_play(int argc, char** argv)
{
    const std::string file      = argValue(argc, argv, "file", "");
    const std::string exportDir = argValue(argc, argv, "export", "");
    const std::string host      = argValue(argc, argv, "host", "127.0.0.1");
    const int port              = argValueInt(argc, argv, "port", rvfstream::rvf::kDefaultPort);
    const int fps               = std::max(1, argValueInt(argc, argv, "fps", 30));
    const bool realtime         = argHas(argc, argv, "realtime");
    const int lines             = argValueInt(argc, argv, "lines", 4);

    if (file.empty()) {
        std::cerr
            << "[play] usage:\n"
            << "  rvfstream-cli play --file=cap.rvr [--host=127.0.0.1] [--port=50070] [--fps=30|--realtime]\n"
            << "  rvfstream-cli play --file=cap.rvr --export=DIR\n";
        return 1;
    }

    rvfstream::FramePlayer player(file);
    if (!player.ok()) {
        std::cerr << "[play] cannot open or bad header: " << file << "\n";
        return 1;
    }

    // ---------- EXPORT AS PNG ----------
    if (!exportDir.empty()) {
        ExportSummary sum;
        bool ok = false;
        try {
            ok = export_capture_png(player, exportDir, sum);
        } catch (const std::exception& e) {
            std::cerr << "[play] error: " << e.what() << '\n';
        }
        std::cout << "[play] exported " << sum.frames << " frames to " << exportDir
                  << " (crc errors: " << sum.crcErrors
                  << ", bad records: " << sum.badRecords << ")\n";
        return ok ? 0 : 1;
    }

    std::vector<std::uint8_t> scratch;
    rvfstream::Frame f{};
    rvfstream::FrameMeta meta{};
    std::uint64_t ts_ns = 0;
    bool crc_ok = true;
    std::uint64_t frames = 0, crcErrors = 0;

    // ---------- RE-SEND AS RVF ----------
    try {
        rvfstream::UdpSender tx(host, static_cast<std::uint16_t>(port));
        rvfstream::Packetizer packetizer(lines);

        std::cout << "[play] sending " << file << " to " << host << ":" << port
                  << (realtime ? " at recorded pace" : " at " + std::to_string(fps) + " fps") << "\n";

        const auto frameDelay = std::chrono::microseconds(1'000'000 / fps);
        std::uint64_t prev_ts = 0;

        while (player.readNext(f, scratch, &meta, &ts_ns, &crc_ok)) {
            if (!crc_ok) {
                ++crcErrors;
                std::cerr << "[play] crc mismatch in frame " << frames << ", sending anyway\n";
            }

            // the capture keeps the original frame id; seq is renumbered by the packetizer
            for (const auto& dg : packetizer.packetize(f.data, meta.frameId)) tx.send(dg);
            ++frames;

            if (frames % static_cast<std::uint64_t>(fps) == 0)
                std::cout << "[play] sent frames: " << frames << "\n";

            if (realtime && prev_ts != 0 && ts_ns > prev_ts) {
                std::this_thread::sleep_for(std::chrono::nanoseconds(ts_ns - prev_ts));
            } else if (!realtime) {
                std::this_thread::sleep_for(frameDelay);
            }
            prev_ts = ts_ns;
        }

        std::cout << "[play] done. frames: " << frames
                  << ", datagrams: " << tx.sent()
                  << ", crc errors: " << crcErrors << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[play] error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
