#pragma once

#include "./plugin.hpp"

/*
 * Plugin modules are shared objects that export a factory with C linkage:
 *
 *     DPLY_PLUGIN_API dply::deploy_plugin* dply_create_plugin(dply::deploy_context& ctx);
 *
 * The returned object is owned by dply and destroyed through its virtual destructor before the
 * module is unloaded. The plugin's type is the module's file stem, with any leading "lib"
 * removed: "libecho.so" provides the "echo" type.
 */

#if defined(_WIN32)
#define DPLY_PLUGIN_EXPORT __declspec(dllexport)
#else
#define DPLY_PLUGIN_EXPORT __attribute__((visibility("default")))
#endif

#define DPLY_PLUGIN_API extern "C" DPLY_PLUGIN_EXPORT

namespace dply {

using create_plugin_fn = deploy_plugin*(deploy_context&);

inline constexpr const char* create_plugin_symbol = "dply_create_plugin";

}  // namespace dply
