#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <chrono>
#include <cstddef>

#define DEFAULT_BLOCK_SIZE 16384

/*
 * Tunables for one download session. The defaults are what the command line
 * client runs with; embedders and tests override individual fields.
 */
struct SessionSettings {
	int block_size = DEFAULT_BLOCK_SIZE;

	/* request limits */
	int max_requests_per_peer = 8;
	int max_global_requests = 256;

	/* endgame starts once this many blocks or fewer are still missing */
	int endgame_threshold = 16;

	/* watchdog */
	std::chrono::milliseconds request_timeout{30000};
	int max_block_retries = 3;

	/* connection timers */
	std::chrono::milliseconds handshake_timeout{10000};
	std::chrono::milliseconds inactivity_timeout{120000};
	std::chrono::milliseconds keepalive_interval{90000};

	std::chrono::milliseconds tick_interval{200};

	int max_write_retries = 3;
	std::size_t max_peers = 50;

	/* largest frame we accept: a piece message carrying a 1 MiB block */
	std::size_t max_message_length = (1 << 20) + 13;

	/* peers at or above this many penalty points are scheduled last */
	int penalty_threshold = 3;
};

#endif /* settings.hpp */
