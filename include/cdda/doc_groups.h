/**
 * @file doc_groups.h
 * @brief Doxygen group definitions for the cdda library
 *
 * This file defines the module/group structure for the documentation.
 * It doesn't contain any actual code.
 */

#ifndef CDDA_DOC_GROUPS_H
#define CDDA_DOC_GROUPS_H

/**
 * @defgroup cdda cdda Library
 * @brief Seekable PCM streams read straight from audio CDs
 */

/**
 * @defgroup streams Sector Streams
 * @ingroup cdda
 * @brief Byte-addressed reading and seeking over a disc
 *
 * A sector_stream turns arbitrary reads and seeks into whole-sector
 * device reads and keeps the unconsumed part of the last sector buffered.
 */

/**
 * @defgroup sdk SDK
 * @ingroup cdda
 * @brief Building blocks shared by the stream and the drive backends
 *
 * Redbook constants, sector arithmetic, the table of contents model
 * and the drive backend interface.
 */

/**
 * @defgroup sdk_io I/O Streams
 * @ingroup sdk
 * @brief Binary stream abstraction used for WAV output and by sector_stream
 */

/**
 * @defgroup backends Drive Backends
 * @ingroup cdda
 * @brief Implementations of drive_backend
 *
 * The null backend is always available. The libcdio and cdparanoia
 * backends are built when their libraries are found.
 */

/**
 * @defgroup errors Error Handling
 * @ingroup cdda
 * @brief Exception hierarchy rooted at cdda::cdda_error
 */

#endif // CDDA_DOC_GROUPS_H
