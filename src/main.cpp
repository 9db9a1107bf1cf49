#include <boost/asio.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <log.hpp>
#include <peer_info.hpp>
#include <session.hpp>
#include <storage.hpp>
#include <torrent_file.hpp>
#include <utils.hpp>
#include <chrono>
#include <csignal>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace std;

#define PROGRESS_INTERVAL std::chrono::seconds(5)

static void usage(const char *prog)
{
    cout << "usage: " << prog << " [-v|-q] <torrent_file> [listen_port] [ip:port ...]" << endl;
}

static string format_progress(const ProgressSnapshot& snap)
{
    ostringstream out;
    out << "progress: " << fixed << setprecision(1) << snap.completion << "% ("
        << snap.verified_pieces << "/" << snap.total_pieces << " pieces, "
        << format_bytes(snap.bytes_left) << " remaining) "
        << "down " << format_bytes(static_cast<int64_t>(snap.download_rate)) << "/s "
        << "up " << format_bytes(static_cast<int64_t>(snap.upload_rate)) << "/s "
        << snap.peers << " peers";
    if (snap.endgame) {
        out << " [endgame]";
    }
    return out.str();
}

static void monitor_download_progress(boost::asio::steady_timer& timer, const Session& session)
{
    timer.expires_after(PROGRESS_INTERVAL);
    timer.async_wait([&timer, &session](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (!session.is_complete()) {
            log_info(format_progress(session.progress()));
        }
        monitor_download_progress(timer, session);
    });
}

int main(int argc, char *argv[])
{
    vector<string> args;
    for (int i = 1; i < argc; i++) {
        string arg(argv[i]);
        if (arg == "-v") {
            set_log_level(LogLevel::debug);
        } else if (arg == "-q") {
            set_log_level(LogLevel::error);
        } else if (arg == "-h" || arg == "--help") {
            usage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        usage(argv[0]);
        return 1;
    }

    string filename = args[0];
    if (!boost::algorithm::ends_with(filename, ".torrent")) {
        cerr << "error: filename must end in .torrent" << endl;
        return 1;
    }

    int acceptor_port = -1;
    vector<PeerInfo> peers;
    try {
        for (size_t i = 1; i < args.size(); i++) {
            if (args[i].find(':') != string::npos) {
                peers.push_back(parse_peer_address(args[i]));
            } else if (i == 1 && boost::algorithm::all(args[i], boost::algorithm::is_digit())) {
                acceptor_port = stoi(args[i]);
                if (acceptor_port > 65535) {
                    throw invalid_argument("listening port out of range");
                }
            } else {
                throw invalid_argument("unexpected argument '" + args[i] + "'");
            }
        }
    } catch (const exception& e) {
        cerr << "error: " << e.what() << endl;
        usage(argv[0]);
        return 1;
    }

    try {
        boost::asio::io_context io;

        TorrentMetadata torrent = load_torrent_file(filename);
        torrent.print_info();

        FileStorage storage(torrent.file_name, torrent.piece_length);

        int exit_code = 0;
        boost::asio::steady_timer progress_timer(io);
        boost::asio::signal_set signals(io, SIGINT, SIGTERM);

        SessionEvents events;
        events.on_complete = [&]() {
            cout << "\n=== download complete! ===\n" << endl;
            cout << "=== seeding ===" << endl;
            cout << "press Ctrl+C to exit\n" << endl;
        };
        events.on_failure = [&](const string& reason) {
            cerr << "error: download failed: " << reason << endl;
            exit_code = 1;
            progress_timer.cancel();
            signals.cancel();
        };

        Session session(io, torrent, storage, SessionSettings(), events);
        session.resume();

        signals.async_wait([&](const boost::system::error_code& ec, int signal) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            cout << "\nReceived signal " << signal << ", shutting down gracefully..." << endl;
            progress_timer.cancel();
            session.stop();
        });

        if (acceptor_port >= 0) {
            session.listen(static_cast<uint16_t>(acceptor_port));
        }

        if (!session.is_complete()) {
            if (peers.empty() && acceptor_port < 0) {
                cerr << "error: no peers given and not listening, nothing to do" << endl;
                return 1;
            }
            cout << "=== connecting to peers ===" << endl;
            session.add_peer_candidates(peers);
        }

        session.start();
        monitor_download_progress(progress_timer, session);

        io.run();

        cout << "shutdown complete. exiting." << endl;
        return exit_code;

    } catch (const exception& e) {
        cerr << "error: " << e.what() << endl;
        return 1;
    }
}
