#ifndef REVERIE_H
#define REVERIE_H

/**
 * Reverie - Effect-cycling render engine
 *
 * Single include for the engine, its collaborator interfaces and the
 * built-in effect catalog.
 *
 * Architecture:
 * - Engine: scheduler state machine, pacing and rotation
 * - FrameBuffer / Palette: the shared drawing surface
 * - MemoryGuardian: fixed scratch arena for effect instances and tables
 * - EffectRegistry: the validated, sealed rotation
 * - Clock / Display: injected platform collaborators
 */

#include "constants.h"
#include "logging.h"

#include "core/engine_error.h"
#include "core/clock.h"
#include "core/display.h"
#include "core/frame_buffer.h"
#include "core/palette.h"
#include "core/memory_guardian.h"
#include "core/effect.h"
#include "core/effect_registry.h"
#include "core/engine_config.h"
#include "core/engine.h"
#include "core/engine_status.h"

#include "effects/effects.h"

#endif // REVERIE_H
