/**
 * WindowsCredentialBackend.cpp
 */

#include "WindowsCredentialBackend.hpp"
#include "CredentialDocument.hpp"
#include "CredentialLocator.hpp"
#include "../Logger.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

namespace keyrotor::core::auth {

using utils::ProcessRequest;
using utils::ProcessResult;
using utils::StringUtils;

namespace {

constexpr const char* CREDENTIAL_USER_NAME = "claude-ai-oauth";

// Shared P/Invoke declarations; CREDENTIAL mirrors wincred.h
constexpr const char* CREDENTIAL_SIGNATURE = R"PS(
$sig = @'
[StructLayout(LayoutKind.Sequential, CharSet = CharSet.Unicode)]
public struct CREDENTIAL {
  public int Flags;
  public int Type;
  public string TargetName;
  public string Comment;
  public System.Runtime.InteropServices.ComTypes.FILETIME LastWritten;
  public int CredentialBlobSize;
  public IntPtr CredentialBlob;
  public int Persist;
  public int AttributeCount;
  public IntPtr Attributes;
  public string TargetAlias;
  public string UserName;
}

[DllImport("advapi32.dll", SetLastError = true, CharSet = CharSet.Unicode)]
public static extern bool CredRead(string target, int type, int reservedFlag, out IntPtr credentialPtr);

[DllImport("advapi32.dll", SetLastError = true, CharSet = CharSet.Unicode)]
public static extern bool CredWrite(ref CREDENTIAL credential, int flags);

[DllImport("advapi32.dll", SetLastError = true)]
public static extern void CredFree(IntPtr cred);
'@
Add-Type -MemberDefinition $sig -Namespace KeyRotor -Name Credential
)PS";

} // namespace

WindowsCredentialBackend::WindowsCredentialBackend(utils::ProcessRunner& runner, ExecutableResolver resolver,
                                                   Milliseconds timeout)
    : m_runner(runner)
    , m_resolver(std::move(resolver))
    , m_timeout(timeout) {
}

std::string WindowsCredentialBackend::buildReadScript(const std::string& target) {
    std::string script = "$ErrorActionPreference = 'Stop'\n";
    script += CREDENTIAL_SIGNATURE;
    script += R"PS(
$credPtr = [IntPtr]::Zero
# CRED_TYPE_GENERIC = 1
$found = [KeyRotor.Credential]::CredRead(")PS";
    script += StringUtils::escapePowerShell(target);
    script += R"PS(", 1, 0, [ref]$credPtr)
if ($found) {
  try {
    $cred = [Runtime.InteropServices.Marshal]::PtrToStructure($credPtr, [Type][KeyRotor.Credential+CREDENTIAL])
    if ($cred.CredentialBlobSize -gt 0) {
      $blob = [byte[]]::new($cred.CredentialBlobSize)
      [Runtime.InteropServices.Marshal]::Copy($cred.CredentialBlob, $blob, 0, $cred.CredentialBlobSize)
      Write-Output ([System.Text.Encoding]::Unicode.GetString($blob))
    }
  } finally {
    [KeyRotor.Credential]::CredFree($credPtr)
  }
} else {
  Write-Output ""
}
)PS";
    return script;
}

std::string WindowsCredentialBackend::buildWriteScript(const std::string& target,
                                                       const std::string& base64Document) {
    std::string script = "$ErrorActionPreference = 'Stop'\n";
    script += CREDENTIAL_SIGNATURE;
    script += R"PS(
$json = [System.Text.Encoding]::UTF8.GetString([System.Convert]::FromBase64String(')PS";
    script += base64Document;
    script += R"PS('))
$jsonBytes = [System.Text.Encoding]::Unicode.GetBytes($json)
$jsonPtr = [System.Runtime.InteropServices.Marshal]::AllocHGlobal($jsonBytes.Length)
[System.Runtime.InteropServices.Marshal]::Copy($jsonBytes, 0, $jsonPtr, $jsonBytes.Length)
try {
  $cred = New-Object KeyRotor.Credential+CREDENTIAL
  $cred.Type = 1
  $cred.TargetName = ")PS";
    script += StringUtils::escapePowerShell(target);
    script += R"PS("
  $cred.CredentialBlob = $jsonPtr
  $cred.CredentialBlobSize = $jsonBytes.Length
  # CRED_PERSIST_LOCAL_MACHINE
  $cred.Persist = 2
  $cred.UserName = ")PS";
    script += CREDENTIAL_USER_NAME;
    script += R"PS("
  if (-not [KeyRotor.Credential]::CredWrite([ref]$cred, 0)) {
    throw "CredWrite failed"
  }
  Write-Output "SUCCESS"
} finally {
  [System.Runtime.InteropServices.Marshal]::FreeHGlobal($jsonPtr)
}
)PS";
    return script;
}

ProcessResult WindowsCredentialBackend::runScript(const std::string& program, const std::string& script) {
    ProcessRequest request;
    request.program = program;
    request.args = {"-NoProfile", "-NonInteractive", "-ExecutionPolicy", "Bypass", "-Command", script};
    request.timeout = m_timeout;
    return m_runner.run(request);
}

FullOAuthCredentials WindowsCredentialBackend::read(const std::string& configDir) {
    std::string target = CredentialLocator::keychainServiceName(configDir);
    if (!CredentialLocator::isValidTargetName(target)) {
        Logger::instance().error("Refusing Credential Manager lookup for invalid target name");
        return FullOAuthCredentials::failure(CredentialErrorKind::MalformedData,
                                             "Invalid Credential Manager target name");
    }

    auto powershell = m_resolver("powershell");
    if (!powershell) {
        Logger::instance().debug("PowerShell not found, Credential Manager unavailable");
        FullOAuthCredentials result;
        result.errorKind = CredentialErrorKind::ToolMissing;
        return result;
    }

    ProcessResult result = runScript(powershell->string(), buildReadScript(target));

    if (result.timedOut) {
        Logger::instance().warn("Credential Manager lookup for {} timed out", target);
        return FullOAuthCredentials::failure(CredentialErrorKind::AccessDenied,
                                             "Credential Manager access timed out");
    }
    if (!result.succeeded()) {
        std::string detail = result.launched ? StringUtils::trim(result.stderrText) : result.error;
        Logger::instance().warn("Credential Manager lookup for {} failed: {}", target, detail);
        return FullOAuthCredentials::failure(CredentialErrorKind::AccessDenied,
                                             "Credential Manager access failed: " + detail);
    }

    return parseCredentialText(StringUtils::trim(result.stdoutText), "credential-manager:" + target);
}

UpdateResult WindowsCredentialBackend::write(const std::string& configDir, const std::string& document) {
    std::string target = CredentialLocator::keychainServiceName(configDir);
    if (!CredentialLocator::isValidTargetName(target)) {
        return UpdateResult::failure(CredentialErrorKind::MalformedData,
                                     "Invalid Credential Manager target name");
    }

    auto powershell = m_resolver("powershell");
    if (!powershell) {
        return UpdateResult::failure(CredentialErrorKind::ToolMissing, "PowerShell not found");
    }

    std::string encoded = utils::HashUtils::base64Encode(document);
    ProcessResult result = runScript(powershell->string(), buildWriteScript(target, encoded));

    if (result.timedOut) {
        return UpdateResult::failure(CredentialErrorKind::AccessDenied, "Credential Manager update timed out");
    }
    if (!result.succeeded() || StringUtils::trim(result.stdoutText) != "SUCCESS") {
        std::string detail = result.launched ? StringUtils::trim(result.stderrText) : result.error;
        Logger::instance().warn("Credential Manager update for {} failed: {}", target, detail);
        return UpdateResult::failure(CredentialErrorKind::AccessDenied,
                                     "Credential Manager update failed: " + detail);
    }

    return UpdateResult::ok();
}

} // namespace keyrotor::core::auth
