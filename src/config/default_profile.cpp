#include "config/default_profile.hpp"

namespace steward {

namespace {

constexpr const char *kHeadlessMacProfile = R"json(
{
  "options": {
    "stopOnFailure": false,
    "commandTimeoutMs": 120000,
    "searchPaths": ["/opt/homebrew/bin", "/usr/local/bin", "~/go/bin"]
  },
  "resources": [
    {
      "id": "homebrew",
      "type": "executable",
      "description": "Homebrew package manager",
      "privilege": "user",
      "desired": "present",
      "params": {
        "program": "brew",
        "install": ["/bin/bash", "-c",
          "NONINTERACTIVE=1 /bin/bash -c \"$(curl -fsSL https://raw.githubusercontent.com/Homebrew/install/HEAD/install.sh)\""]
      }
    },
    {
      "id": "go",
      "type": "executable",
      "description": "Go toolchain",
      "desired": "present",
      "dependsOn": ["homebrew"],
      "params": {"program": "go", "install": ["brew", "install", "go"]}
    },
    {
      "id": "tailscale",
      "type": "executable",
      "description": "tailscale and tailscaled built from source",
      "desired": "present",
      "dependsOn": ["go"],
      "params": {
        "program": "tailscaled",
        "install": ["go", "install", "tailscale.com/cmd/tailscale@main",
                    "tailscale.com/cmd/tailscaled@main"]
      }
    },
    {
      "id": "tailscale-daemon",
      "type": "launchd-job",
      "description": "tailscaled system daemon",
      "privilege": "root",
      "desired": "installed",
      "dependsOn": ["tailscale"],
      "verify": {"attempts": 10, "delayMs": 500},
      "params": {
        "label": "com.tailscale.tailscaled",
        "plist": "/Library/LaunchDaemons/com.tailscale.tailscaled.plist",
        "apply": ["tailscaled", "install-system-daemon"]
      }
    },
    {
      "id": "filevault",
      "type": "toggle",
      "description": "FileVault off so the machine boots without a console login",
      "privilege": "root",
      "desired": "off",
      "params": {
        "query": ["fdesetup", "status"],
        "onMarkers": ["FileVault is On."],
        "apply": {"off": ["fdesetup", "disable"]}
      }
    },
    {
      "id": "remote-login",
      "type": "toggle",
      "description": "built-in SSH server off",
      "privilege": "root",
      "desired": "off",
      "params": {
        "query": ["systemsetup", "-getremotelogin"],
        "onMarkers": ["Remote Login: On"],
        "apply": {"off": ["systemsetup", "-f", "-setremotelogin", "off"]}
      }
    },
    {
      "id": "firewall",
      "type": "toggle",
      "description": "application firewall on",
      "privilege": "root",
      "desired": "on",
      "params": {
        "query": ["/usr/libexec/ApplicationFirewall/socketfilterfw", "--getglobalstate"],
        "onMarkers": ["enabled", "blocking"],
        "apply": {"on": ["/usr/libexec/ApplicationFirewall/socketfilterfw", "--setglobalstate", "on"]}
      }
    },
    {
      "id": "firewall-allow-signed",
      "type": "toggle",
      "description": "signed software may accept connections",
      "privilege": "root",
      "desired": "on",
      "dependsOn": ["firewall"],
      "params": {
        "query": ["/usr/libexec/ApplicationFirewall/socketfilterfw", "--getallowsigned"],
        "onMarkers": ["ENABLED"],
        "apply": {"on": ["/usr/libexec/ApplicationFirewall/socketfilterfw", "--setallowsigned", "on"]}
      }
    },
    {
      "id": "firewall-stealth",
      "type": "toggle",
      "description": "stealth mode on",
      "privilege": "root",
      "desired": "on",
      "dependsOn": ["firewall"],
      "params": {
        "query": ["/usr/libexec/ApplicationFirewall/socketfilterfw", "--getstealthmode"],
        "onMarkers": ["stealth mode is on", "Stealth mode enabled"],
        "apply": {"on": ["/usr/libexec/ApplicationFirewall/socketfilterfw", "--setstealthmode", "on"]}
      }
    },
    {
      "id": "firewall-exceptions",
      "type": "firewall-apps",
      "description": "incoming connections for tailscaled and continuity services",
      "privilege": "root",
      "desired": [
        "{exe:tailscaled}",
        "/System/Library/CoreServices/RemoteManagement/ARDAgent.app",
        "/System/Library/CoreServices/UniversalControl.app",
        "/usr/libexec/sharingd",
        "/usr/libexec/rapportd"
      ],
      "dependsOn": ["firewall", "tailscale"]
    },
    {
      "id": "screen-sharing",
      "type": "launchd-job",
      "description": "Screen Sharing (VNC) service",
      "privilege": "root",
      "desired": "loaded",
      "verify": {"attempts": 5, "delayMs": 500},
      "params": {
        "label": "com.apple.screensharing",
        "plist": "/System/Library/LaunchDaemons/com.apple.screensharing.plist",
        "apply": ["launchctl", "load", "-w", "/System/Library/LaunchDaemons/com.apple.screensharing.plist"]
      }
    },
    {
      "id": "pmset-sleep",
      "type": "pmset",
      "description": "system sleep disabled",
      "privilege": "root",
      "desired": "0",
      "params": {"setting": "sleep"}
    },
    {
      "id": "pmset-disksleep",
      "type": "pmset",
      "description": "disk sleep disabled",
      "privilege": "root",
      "desired": "0",
      "params": {"setting": "disksleep"}
    },
    {
      "id": "pmset-powernap",
      "type": "pmset",
      "description": "Power Nap disabled",
      "privilege": "root",
      "desired": "0",
      "params": {"setting": "powernap"}
    },
    {
      "id": "tailscale-connected",
      "type": "toggle",
      "description": "node connected to the tailnet",
      "privilege": "root",
      "desired": "on",
      "dependsOn": ["tailscale-daemon"],
      "verify": {"attempts": 10, "delayMs": 1000},
      "params": {
        "query": ["tailscale", "status"],
        "onMarkers": ["active"],
        "nonZeroExitMeansOff": true,
        "apply": {"on": ["tailscale", "up", "--timeout=60s"]}
      }
    },
    {
      "id": "dns-magicdns",
      "type": "dns-servers",
      "description": "MagicDNS resolver on the primary network service",
      "privilege": "root",
      "desired": ["100.100.100.100"],
      "dependsOn": ["tailscale-connected"],
      "params": {"service": "Wi-Fi"}
    }
  ]
}
)json";

} // namespace

nlohmann::json defaultProfile()
{
    return nlohmann::json::parse(kHeadlessMacProfile);
}

} // namespace steward
