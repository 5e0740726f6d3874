#pragma once

#include <memory>
#include <shared_mutex>

#include <Session.hh>

namespace PanelDriver
{

/*
 * Holds the device's current Session, or nothing.
 * Readers copy the pointer out and let go of the lock before doing any I/O,
 * so an in-flight transaction keeps its Session alive after a clear().
 */
class SessionSlot
{
	public:
		std::shared_ptr<Session> get() const;
		bool occupied() const;

		// false if something was already installed, or the slot is closed
		bool install(std::shared_ptr<Session> s);

		// returns what was there
		std::shared_ptr<Session> clear();

		// clear, and refuse every later install
		std::shared_ptr<Session> close();

	private:
		mutable std::shared_mutex mtx;
		std::shared_ptr<Session> session;
		bool closed = false;
};

}
