#pragma once

/**
 * @brief Planar geometry classes for Paperspace
 */
namespace PaperspaceGeometry {}

#if defined(_WIN32) && defined(PAPERSPACE_SHARED)
#ifdef PAPERSPACEGEOMETRY_BUILDING
#define PAPERSPACEGEOMETRY_API __declspec(dllexport)
#else
#define PAPERSPACEGEOMETRY_API __declspec(dllimport)
#endif
#else
#define PAPERSPACEGEOMETRY_API
#endif
