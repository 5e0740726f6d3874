#include <mutex>
#include <utility>

#include <SessionSlot.hh>

namespace PanelDriver {

std::shared_ptr<Session> SessionSlot::get() const
{
	std::shared_lock lock(mtx);
	return session;
}

bool SessionSlot::occupied() const
{
	std::shared_lock lock(mtx);
	return session != nullptr;
}

bool SessionSlot::install(std::shared_ptr<Session> s)
{
	std::unique_lock lock(mtx);
	if (closed || session) {
		return false;
	}
	session = std::move(s);
	return true;
}

std::shared_ptr<Session> SessionSlot::clear()
{
	std::unique_lock lock(mtx);
	return std::exchange(session, nullptr);
}

std::shared_ptr<Session> SessionSlot::close()
{
	std::unique_lock lock(mtx);
	closed = true;
	return std::exchange(session, nullptr);
}

}
