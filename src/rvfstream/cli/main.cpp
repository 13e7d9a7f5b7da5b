#include "modes.hpp"

#include <iostream>
#include <string>

/*
  CLI entry point.

  Modes:
    - send    : generate frames, slice them into RVF datagrams, send via UDP.
    - receive : reassemble RVF datagrams into frames.
    - play    : replay or export a capture file.
    - watch   : follow a receiver's gRPC relay.
*/
static void print_usage() {
    std::cout
        << "Usage:\n"
        << "  rvfstream-cli send    [--host=127.0.0.1] [--port=50070] [--fps=30] [--lines=4]\n"
        << "                        [--pattern=gradient|grid|checker|noise|text:HELLO] [--image=in.png]\n"
        << "                        [--frames=N] [--loss=0.0]\n"
        << "  rvfstream-cli receive [--net=fast|balanced|robust] [--port=50070] [--bufcap=64]\n"
        << "                        [--drop=oldest|newest] [--signal-lost=2000] [--health=2000]\n"
        << "                        [--record=cap.rvr] [--relay=50071] [--outdir=DIR] [--save=last_frame.png]\n"
        << "                        [--duration=SECONDS] [--view] [--verbose]\n"
        << "  rvfstream-cli play    --file=cap.rvr [--host=127.0.0.1] [--port=50070] [--fps=30|--realtime]\n"
        << "                        [--lines=4] [--export=DIR]\n"
        << "     play with --export writes every frame as PNG;\n"
        << "     otherwise it re-sends the capture as RVF over UDP.\n"
        << "  rvfstream-cli watch   [--server=localhost:50071] [--view] [--save=watch.png] [--duration=SECONDS]\n";
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return 0; }
    const std::string mode = argv[1];

    if      (mode == "send")    return run_send   (argc, argv);
    else if (mode == "receive") return run_receive(argc, argv);
    else if (mode == "play")    return run_play   (argc, argv);
    else if (mode == "watch")   return run_watch  (argc, argv);

    std::cout << "Unknown mode: " << mode << "\n";
    print_usage();
    return 1;
}
