// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <type_traits>
#include <utility>

namespace Utils {

// Runs a callable when the enclosing scope exits, unless released first.
template <typename F>
class ScopeGuard final {
public:
	explicit ScopeGuard(F f) noexcept(std::is_nothrow_move_constructible_v<F>)
		: m_onExit(std::move(f))
	{}

	ScopeGuard(const ScopeGuard&) = delete;
	ScopeGuard& operator=(const ScopeGuard&) = delete;

	~ScopeGuard()
	{
		if (m_armed)
			m_onExit();
	}

	void release() noexcept { m_armed = false; }

private:
	F m_onExit;
	bool m_armed = true;
};

template <typename F>
ScopeGuard(F) -> ScopeGuard<F>;

// Assigns |value| to |target| for the lifetime of the guard and puts the
// previous value back on exit. Re-entrant: nested guards restore in order.
template <typename T>
class ScopedAssign final {
public:
	ScopedAssign(T& target, T value)
		: m_target(target)
		, m_previous(std::exchange(target, std::move(value)))
	{}

	ScopedAssign(const ScopedAssign&) = delete;
	ScopedAssign& operator=(const ScopedAssign&) = delete;

	~ScopedAssign() { m_target = std::move(m_previous); }

	const T& previous() const { return m_previous; }

private:
	T& m_target;
	T m_previous;
};

} // namespace Utils
