/*
*  This file is part of flexplayer project.
*  Copyright (C) 2025 flexplayer contributors
*
*  flexplayer is free software: you can redistribute it and/or modify
*  it under the terms of the GNU General Public License as published by
*  the Free Software Foundation; either version 3 of the License, or
*  (at your option) any later version.

*  flexplayer is distributed in the hope that it will be useful,
*  but WITHOUT ANY WARRANTY; without even the implied warranty of
*  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
*  GNU General Public License for more details.
*
*  You should have received a copy of the GNU General Public License
*  along with flexplayer. If not, see <http://www.gnu.org/licenses/>.
*/


#include <fstream>
#include <memory>
#include <QCoreApplication>
#include <QTimer>
#include <boost/log/utility/setup.hpp>
#include <flex/player/Common/Log.hpp>
#include <flex/player/Analysis/SpectrumAnalyzer.hpp>
#include <flex/player/Configuration/Configuration.hpp>
#include <flex/player/Control/PlayerController.hpp>
#include <flex/player/Decoder/FFmpegAudioDecoder.hpp>
#include <flex/player/Output/RtAudioOutput.hpp>
#include <flex/player/Playback/PlaybackEngine.hpp>
#include <flex/player/Playlist/PlaylistManager.hpp>
#include <flex/player/Playlist/QtDirectoryLister.hpp>

namespace player = flex::player;

void configureLogging()
{
  const std::string logIni = "flexplayer-logs.ini";
  std::ifstream logSettings(logIni);
  if (logSettings.good())
  {
    try
    {
      // For boost < 1.71 the severity types are not automatically parsed so
      // lets register them.
      boost::log::register_simple_filter_factory<
          boost::log::trivial::severity_level>("Severity");
      boost::log::register_simple_formatter_factory<
          boost::log::trivial::severity_level, char>("Severity");
      boost::log::init_from_stream(logSettings);
    }
    catch (std::exception const &e)
    {
      FLEX_LOG(warning)
          << "[FlexPlayer] " << logIni << " was provided but was not valid: " << e.what();
    }
  }
}

float bandAverage(const player::analysis::Spectrum &spectrum, size_t begin, size_t end)
{
  float sum = 0.0f;
  for (size_t i = begin; i < end; ++i)
  {
    sum += spectrum[i];
  }
  return end > begin ? sum / static_cast<float>(end - begin) : 0.0f;
}

QString findFirstTrack(const player::playlist::IDirectoryLister &lister, const std::string &musicPath)
{
  QStringList files;
  if (!lister.listAudioFiles(QString::fromStdString(musicPath), files) || files.isEmpty())
  {
    return QString();
  }
  files.sort();
  return files.first();
}

int main(int argc, char *argv[])
{
  configureLogging();

  QCoreApplication qApplication(argc, argv);

  FLEX_LOG(info) << "[FlexPlayer] Starting...";

  auto configuration = std::make_shared<player::configuration::Configuration>();

  auto lister = std::make_shared<player::playlist::QtDirectoryLister>(configuration->getAudioExtensions());

  QString trackPath;
  const QStringList arguments = qApplication.arguments();
  if (arguments.size() > 1)
  {
    trackPath = arguments.at(1);
  }
  else
  {
    trackPath = findFirstTrack(*lister, configuration->getMusicPath());
    if (trackPath.isEmpty())
    {
      FLEX_LOG(error) << "[FlexPlayer] No audio files found in " << configuration->getMusicPath();
      return 1;
    }
  }

  std::unique_ptr<player::analysis::SpectrumAnalyzer> analyzer;
  try
  {
    analyzer = std::make_unique<player::analysis::SpectrumAnalyzer>(configuration->getAnalyzerSettings());
  }
  catch (const std::exception &e)
  {
    FLEX_LOG(error) << "[FlexPlayer] Failed to create spectrum analyzer: " << e.what();
    return 1;
  }

  player::playlist::PlaylistManager playlist(lister, configuration->shuffle());

  auto output = std::make_shared<player::output::RtAudioOutput>(configuration->getAudioOutputDeviceName());
  auto decoder = std::make_shared<player::decoder::FFmpegAudioDecoder>();

  player::playback::PlaybackEngine engine(configuration, decoder, output, *analyzer, playlist);
  player::control::PlayerController controller(configuration, engine, playlist);

  QObject::connect(&controller, &player::control::PlayerController::trackChanged,
                   [](const QString &filePath, const QString &title)
                   {
                     FLEX_LOG(info) << "[FlexPlayer] Track: " << title.toStdString()
                                    << " (" << filePath.toStdString() << ")";
                   });
  QObject::connect(&controller, &player::control::PlayerController::playbackError,
                   [](const QString &error)
                   {
                     FLEX_LOG(error) << "[FlexPlayer] " << error.toStdString();
                   });
  QObject::connect(&controller, &player::control::PlayerController::playbackStopped,
                   &qApplication, &QCoreApplication::quit, Qt::QueuedConnection);

  // Coarse view of what a renderer would draw
  QTimer visualizationTimer;
  QObject::connect(&visualizationTimer, &QTimer::timeout,
                   [&analyzer, &engine]()
                   {
                     const auto spectrum = analyzer->snapshot();
                     const auto state = engine.getState();
                     FLEX_LOG(debug) << "[FlexPlayer] " << player::playback::toString(state.status)
                                     << " " << engine.getPosition() << "s / " << state.durationSeconds << "s"
                                     << " volume " << state.volume << "%"
                                     << " bass " << bandAverage(spectrum, 0, player::analysis::cBassBins)
                                     << " mid " << bandAverage(spectrum, player::analysis::cBassBins, player::analysis::cBassBins + player::analysis::cMidBins)
                                     << " high " << bandAverage(spectrum, player::analysis::cBassBins + player::analysis::cMidBins, player::analysis::cVisualizationBins);
                   });

  analyzer->start();

  if (!controller.play(trackPath))
  {
    analyzer->stop();
    return 1;
  }

  controller.startPolling();
  visualizationTimer.start(1000);

  const int result = qApplication.exec();

  visualizationTimer.stop();
  controller.stopPolling();
  engine.stop();
  analyzer->stop();

  FLEX_LOG(info) << "[FlexPlayer] Exiting with code " << result;
  return result;
}
