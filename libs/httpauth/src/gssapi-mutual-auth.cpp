#include "gssapi-mutual-auth.hpp"
#include "crypto.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <gssapi/gssapi.h>

#include "stx/format.h"

namespace httpauth
{

namespace
{

gss_OID_desc SPNEGO_MECHANISM = {6, const_cast<char*>("\x2b\x06\x01\x05\x05\x02")};

std::string describeStatus(OM_uint32 majorStatus, OM_uint32 minorStatus)
{
    std::string result;
    for (auto [code, type] : {std::pair{majorStatus, GSS_C_GSS_CODE},
                              std::pair{minorStatus, GSS_C_MECH_CODE}}) {
        OM_uint32 messageContext = 0;
        do {
            OM_uint32 ignored = 0;
            gss_buffer_desc text = GSS_C_EMPTY_BUFFER;
            if (gss_display_status(&ignored, code, type, GSS_C_NO_OID, &messageContext, &text) != GSS_S_COMPLETE)
                break;
            if (!result.empty())
                result += "; ";
            result.append(static_cast<char const*>(text.value), text.length);
            gss_release_buffer(&ignored, &text);
        } while (messageContext != 0);
    }
    return result;
}

class GssapiContext : public IMutualAuthContext
{
public:
    explicit GssapiContext(std::string const& targetHost)
    {
        auto principal = "HTTP@" + targetHost;
        gss_buffer_desc nameBuffer{principal.size(), principal.data()};
        OM_uint32 minorStatus = 0;
        auto majorStatus = gss_import_name(
            &minorStatus, &nameBuffer, GSS_C_NT_HOSTBASED_SERVICE, &targetName_);
        if (GSS_ERROR(majorStatus))
            throw logRuntimeError<HandshakeFailedError>(stx::format(
                "Cannot import service principal '{}': {}",
                principal, describeStatus(majorStatus, minorStatus)));
    }

    ~GssapiContext() override
    {
        OM_uint32 minorStatus = 0;
        if (context_ != GSS_C_NO_CONTEXT)
            gss_delete_sec_context(&minorStatus, &context_, GSS_C_NO_BUFFER);
        if (targetName_ != GSS_C_NO_NAME)
            gss_release_name(&minorStatus, &targetName_);
    }

    GssapiContext(GssapiContext const&) = delete;
    GssapiContext& operator= (GssapiContext const&) = delete;

    MutualAuthStep produceToken(std::optional<std::string> const& serverToken) override
    {
        std::string inputBytes;
        gss_buffer_desc inputToken = GSS_C_EMPTY_BUFFER;
        if (serverToken) {
            try {
                inputBytes = base64Decode(*serverToken);
            }
            catch (Error const& e) {
                return {MutualAuthStep::Status::Failed, {}, e.what()};
            }
            inputToken = {inputBytes.size(), inputBytes.data()};
        }

        OM_uint32 minorStatus = 0;
        gss_buffer_desc outputToken = GSS_C_EMPTY_BUFFER;
        auto majorStatus = gss_init_sec_context(
            &minorStatus,
            GSS_C_NO_CREDENTIAL,
            &context_,
            targetName_,
            &SPNEGO_MECHANISM,
            GSS_C_MUTUAL_FLAG | GSS_C_SEQUENCE_FLAG,
            GSS_C_INDEFINITE,
            GSS_C_NO_CHANNEL_BINDINGS,
            serverToken ? &inputToken : GSS_C_NO_BUFFER,
            nullptr,
            &outputToken,
            nullptr,
            nullptr);

        MutualAuthStep step;
        if (outputToken.length > 0) {
            step.token = base64Encode(
                std::string(static_cast<char const*>(outputToken.value), outputToken.length));
        }
        OM_uint32 ignored = 0;
        gss_release_buffer(&ignored, &outputToken);

        if (GSS_ERROR(majorStatus)) {
            step.status = MutualAuthStep::Status::Failed;
            step.message = describeStatus(majorStatus, minorStatus);
        }
        else if (majorStatus & GSS_S_CONTINUE_NEEDED)
            step.status = MutualAuthStep::Status::ContinueNeeded;
        else
            step.status = MutualAuthStep::Status::Complete;
        return step;
    }

private:
    gss_name_t targetName_ = GSS_C_NO_NAME;
    gss_ctx_id_t context_ = GSS_C_NO_CONTEXT;
};

}

bool GssapiMutualAuthProvider::supports(AuthScheme scheme) const
{
    return scheme == AuthScheme::Negotiate;
}

std::unique_ptr<IMutualAuthContext> GssapiMutualAuthProvider::createContext(
    AuthScheme scheme,
    std::string const& targetHost)
{
    if (!supports(scheme))
        throw logRuntimeError<HandshakeFailedError>(stx::format(
            "GSSAPI cannot handle scheme {}.", schemeName(scheme)));
    return std::make_unique<GssapiContext>(targetHost);
}

std::shared_ptr<IMutualAuthProvider> defaultMutualAuthProvider()
{
    return std::make_shared<GssapiMutualAuthProvider>();
}

}
