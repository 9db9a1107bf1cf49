#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>

/* Bad protocol string, info hash mismatch or handshake timeout */
class HandshakeError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/* Malformed message framing; the connection cannot continue */
class ProtocolError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/* Storage sink kept failing after all retries */
class PersistenceError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/* Unreadable or inconsistent .torrent data */
class MetainfoError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

#endif /* errors.hpp */
