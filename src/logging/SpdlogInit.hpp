#pragma once

/**
 * Initializes spdlog as the logging backend of HealthUploader.
 * Installs a colored stderr logger as the default logger, which every LOG()
 * call in the project writes through.
 *
 * @note Expected to be called once, before anything logs.
 */
extern void HealthUploader_SpdlogInit();

// Drops the default logger and every registered sink
extern void HealthUploader_SpdlogDeInit();
