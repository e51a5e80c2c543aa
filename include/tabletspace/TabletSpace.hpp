#pragma once
#include "Builder.hpp"
#include "Manager.hpp"
#include "config/InkPacketLayout.hpp"
#include "config/XInput2Heuristics.hpp"
#include "core/Axis.hpp"
#include "core/Error.hpp"
#include "core/FrameTimestamp.hpp"
#include "core/InternalID.hpp"
#include "core/MetricUnit.hpp"
#include "core/NicheF32.hpp"
#include "device/Pad.hpp"
#include "device/Tablet.hpp"
#include "device/Tool.hpp"
#include "events/Events.hpp"
