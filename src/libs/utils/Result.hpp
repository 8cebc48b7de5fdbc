// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <utility>

#include <QString>
#include <QStringList>

namespace Utils {

struct Result {
	bool ok = true;
	QStringList errors;

	static Result success() { return Result{}; }

	static Result failure(const QString& msg)
	{
		Result r;
		r.ok = false;
		r.errors.push_back(msg);
		return r;
	}

	static Result failure(QStringList msgs)
	{
		Result r;
		r.ok = false;
		r.errors = std::move(msgs);
		return r;
	}

	void addError(const QString& msg)
	{
		ok = false;
		errors.push_back(msg);
	}

	// Folds another result into this one, prefixing its messages.
	void merge(const Result& other, const QString& context = {})
	{
		if (other.ok)
			return;
		ok = false;
		for (const QString& e : other.errors)
			errors.push_back(context.isEmpty() ? e : context + QStringLiteral(": ") + e);
	}

	QString joined(const QString& separator = QStringLiteral("\n")) const { return errors.join(separator); }

	explicit operator bool() const { return ok; }
};
} // namespace Utils
