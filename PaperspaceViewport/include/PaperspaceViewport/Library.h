#pragma once

/**
 * @brief Classes for computing the world-space footprint of sheet viewports
 */
namespace PaperspaceViewport {}

#if defined(_WIN32) && defined(PAPERSPACE_SHARED)
#ifdef PAPERSPACEVIEWPORT_BUILDING
#define PAPERSPACEVIEWPORT_API __declspec(dllexport)
#else
#define PAPERSPACEVIEWPORT_API __declspec(dllimport)
#endif
#else
#define PAPERSPACEVIEWPORT_API
#endif
