#pragma once

// Auroscuro - Main header
// Pulls in the whole pipeline: analysis, detection, mapping, rendering, session

#include <auroscuro/audio/analyser.h>
#include <auroscuro/audio/audio_file.h>
#include <auroscuro/audio/beat_detect.h>
#include <auroscuro/audio/spectrum.h>
#include <auroscuro/audio/transport.h>
#include <auroscuro/clock.h>
#include <auroscuro/config.h>
#include <auroscuro/effects/canvas.h>
#include <auroscuro/effects/frame_renderer.h>
#include <auroscuro/io/frame_writer.h>
#include <auroscuro/io/image_loader.h>
#include <auroscuro/io/noise_texture.h>
#include <auroscuro/mapping.h>
#include <auroscuro/recorder.h>
#include <auroscuro/scheduler.h>
#include <auroscuro/session.h>
