// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QStandardPaths>
#include <QtCore/QStringList>

#include <QtWidgets/QApplication>

#include "AppLogging.hpp"
#include "MapWidget.hpp"

#include "mapview/MapConfig.hpp"
#include "utils/async/DebouncedInvoker.hpp"
#include "utils/filesystem/JsonFileUtils.hpp"

Q_LOGGING_CATEGORY(applog, "meridian.app")

static constexpr int saveViewDelayMs = 500;
static constexpr char defaultUrlTemplate[] = "https://{s}.tile.openstreetmap.org/{z}/{x}/{y}.png";

static void printErrorsAndFail(const QString& header, const QStringList& errors)
{
	qCCritical(applog).noquote() << header;
	for (const QString& e : errors)
		qCCritical(applog).noquote() << "  " << e;
}

static QString viewStatePath()
{
	const QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
	if (dir.isEmpty())
		return {};
	return QDir(dir).filePath(QStringLiteral("view-state.json"));
}

static void restoreViewState(const QString& path, MapView::MapConfig& config)
{
	if (path.isEmpty() || !QFileInfo::exists(path))
		return;

	QString error;
	const QJsonObject state = Utils::JsonFileUtils::readObject(path, &error);
	if (!error.isEmpty()) {
		qCWarning(applog).noquote() << "Ignoring stored view:" << error;
		return;
	}

	const Utils::Result applied = config.applyViewState(state);
	if (!applied)
		qCWarning(applog).noquote() << "Ignoring stored view:" << applied.joined(QStringLiteral("; "));
}

static void saveViewState(const QString& path, const Geo::LatLng& center, double zoom)
{
	if (path.isEmpty())
		return;

	const Utils::Result saved =
		Utils::JsonFileUtils::writeObjectAtomic(path, MapView::MapConfig::viewStateToJson(center, zoom));
	if (!saved)
		qCWarning(applog).noquote() << "Failed to store view:" << saved.joined(QStringLiteral("; "));
}

int main(int argc, char** argv)
{
	QApplication app(argc, argv);
	QCoreApplication::setApplicationName(QStringLiteral("Meridian"));

	QCommandLineParser parser;
	parser.setApplicationDescription(QStringLiteral("Tiled map viewer"));
	parser.addHelpOption();
	parser.addPositionalArgument(QStringLiteral("config"), QStringLiteral("Map configuration (JSON)."), QStringLiteral("[config]"));
	const QCommandLineOption freshOption(QStringLiteral("fresh"), QStringLiteral("Start from the configured view, not the last one."));
	parser.addOption(freshOption);
	parser.process(app);

	MapView::MapConfig config;
	const QStringList positional = parser.positionalArguments();
	if (!positional.isEmpty()) {
		const Utils::Result loaded = MapView::MapConfig::load(positional.first(), &config);
		if (!loaded) {
			printErrorsAndFail(QStringLiteral("Failed to load map configuration."), loaded.errors);
			return EXIT_FAILURE;
		}
	} else {
		config.urlTemplate = QString::fromLatin1(defaultUrlTemplate);
		config.zoom = 2.0;
	}

	const QString statePath = viewStatePath();
	if (!parser.isSet(freshOption))
		restoreViewState(statePath, config);

	Meridian::MapWidget widget(config);
	const Utils::Result started = widget.start();
	if (!started) {
		printErrorsAndFail(QStringLiteral("Failed to start the map."), started.errors);
		return EXIT_FAILURE;
	}

	Utils::Async::DebouncedInvoker saver(saveViewDelayMs);
	QObject::connect(&widget, &Meridian::MapWidget::viewSettled, &saver,
	                 [&saver, statePath](const Geo::LatLng& center, double zoom) {
		                 saver.trigger([statePath, center, zoom] { saveViewState(statePath, center, zoom); });
	                 });
	QObject::connect(&app, &QCoreApplication::aboutToQuit, &widget, [&] {
		saver.cancel();
		saveViewState(statePath, widget.viewport().center(), widget.viewport().zoom());
	});

	widget.setWindowTitle(QStringLiteral("Meridian"));
	widget.resize(1024, 768);
	widget.show();

	return app.exec();
}
