/**
 * @file LocalAddress.h
 * @brief Local IPv4 address resolution for LAN-facing URLs
 */

#ifndef CASTSPEAK_LOCAL_ADDRESS_H
#define CASTSPEAK_LOCAL_ADDRESS_H

#include <string>

/**
 * @brief Find the local IPv4 address a LAN peer can reach us on
 *
 * Asks the kernel which source address it would route from toward
 * peerHint (a connected UDP socket sends nothing). Falls back to a public
 * address for the default route, then to the first non-loopback interface,
 * and finally to 127.0.0.1.
 *
 * @param peerHint Dotted IPv4 address of the device, or empty
 */
std::string resolveLocalAddress(const std::string& peerHint = "");

#endif // CASTSPEAK_LOCAL_ADDRESS_H
