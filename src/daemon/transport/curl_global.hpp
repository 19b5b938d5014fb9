#pragma once

// Reference-counted curl_global_init/cleanup shared by every libcurl user.
namespace curl_global {

bool acquire();
void release();

} // namespace curl_global
