#pragma once

#include "edl/EDLTypes.h"
#include <istream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace edl {

/**
 * Assembles logical EDL events from physical lines.
 *
 * The accumulator is either Idle (no event open) or Accumulating one event.
 * An event header flushes the open event and opens a new one; the line right
 * after a header must be its timecode line. Comment, locator, color and M2
 * lines mutate the open event. End of input flushes the last event.
 */
class EventAccumulator {
public:
	struct Idle {};
	struct Accumulating {
		Event event;
	};
	using State = std::variant<Idle, Accumulating>;

	EventAccumulator() = default;

	/**
	 * Consume the whole stream.
	 * @throws ParseError if an event header is not followed by a timecode line
	 */
	void accumulate(std::istream& input);

	// Flushed events, in input order
	const std::vector<Event>& events() const { return events_; }
	std::vector<Event> takeEvents() { return std::move(events_); }

	const std::string& title() const { return title_; }
	const std::string& frameCountMode() const { return fcmMode_; }

	bool isAccumulating() const { return std::holds_alternative<Accumulating>(state_); }

private:
	bool readLine(std::istream& input, std::string& line);
	void openEvent(const std::string& headerLine, std::istream& input);
	void flush();
	void applySpeedLine(Event& event, const std::string& line);
	void applyComment(Event& event, const std::string& line);

	State state_ = Idle{};
	std::vector<Event> events_;
	std::string title_;
	std::string fcmMode_;
	int lineNumber_ = 0;
};

} // namespace edl
