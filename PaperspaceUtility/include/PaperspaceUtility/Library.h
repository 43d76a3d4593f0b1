#pragma once

/**
 * @brief Utility classes shared by the Paperspace libraries
 */
namespace PaperspaceUtility {}

#if defined(_WIN32) && defined(PAPERSPACE_SHARED)
#ifdef PAPERSPACEUTILITY_BUILDING
#define PAPERSPACEUTILITY_API __declspec(dllexport)
#else
#define PAPERSPACEUTILITY_API __declspec(dllimport)
#endif
#else
#define PAPERSPACEUTILITY_API
#endif
