#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value: 0 on success, non-zero on error. */

/* Generate frames and stream them as RVF over UDP.
   Example:
     rvfstream-cli send --host=127.0.0.1 --port=50070 --fps=30 --pattern=gradient */
int run_send   (int argc, char** argv);

/* Receive RVF over UDP, reassemble frames, optional viewer/record/relay.
   Example:
     rvfstream-cli receive --port=50070 --view --record=cap.rvr --relay=50071 */
int run_receive(int argc, char** argv);

/* Replay an RVR1 capture over UDP or export its frames as PNG.
   Example:
     rvfstream-cli play --file=cap.rvr --host=127.0.0.1 --fps=30 */
int run_play   (int argc, char** argv);

/* Watch frames relayed by a receiver over gRPC.
   Example:
     rvfstream-cli watch --server=localhost:50071 --view */
int run_watch  (int argc, char** argv);
