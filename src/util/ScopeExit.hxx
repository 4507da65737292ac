// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <utility>

/**
 * Invoke a function object when leaving the current scope.  Use the
 * #AtScopeExit macro.
 */
template<typename F>
class ScopeExitGuard : F {
	bool enabled = true;

public:
	explicit ScopeExitGuard(F &&f) noexcept
		:F(std::forward<F>(f)) {}

	ScopeExitGuard(ScopeExitGuard &&src) noexcept
		:F(std::move(src)),
		 enabled(std::exchange(src.enabled, false)) {}

	ScopeExitGuard &operator=(ScopeExitGuard &&) = delete;

	~ScopeExitGuard() noexcept {
		if (enabled)
			F::operator()();
	}
};

struct ScopeExitTag {
	template<typename F>
	ScopeExitGuard<F> operator+(F &&f) const noexcept {
		return ScopeExitGuard<F>(std::forward<F>(f));
	}
};

#define ScopeExitCat(a, b) a ## b
#define ScopeExitName(line) ScopeExitCat(at_scope_exit_, line)

/**
 * Usage: AtScopeExit(captures) { code; };
 */
#define AtScopeExit(...) auto ScopeExitName(__LINE__) = ScopeExitTag{} + [__VA_ARGS__]()
