#include "escpos/domain/status/RealTimeStatus.hpp"
#include "escpos/types/Error.hpp"

#include <bitset>

namespace escpos::domain::status {

    using Flag = RealTimeStatusFlag;
    using Request = RealTimeStatusRequest;

    std::pair<uint8_t, uint8_t> requestBytes(RealTimeStatusRequest request) {
        switch (request) {
            case Request::Printer:
                return {1, 0};
            case Request::OfflineCause:
                return {2, 0};
            case Request::ErrorCause:
                return {3, 0};
            case Request::RollPaperSensor:
                return {4, 0};
            case Request::InkA:
                return {7, 1};
            case Request::InkB:
                return {7, 2};
            case Request::Peeler:
                return {8, 3};
            case Request::Interface:
                return {18, 1};
            case Request::DMD:
                return {18, 2};
        }
        return {1, 0};
    }

    std::vector<RealTimeStatusFlag> flagsOf(RealTimeStatusRequest request) {
        switch (request) {
            case Request::Printer:
                return {Flag::DrawerKickOutConnectorPin3Low, Flag::Online, Flag::WaitingForOnlineRecovery,
                        Flag::PaperFeedButtonPressed};
            case Request::OfflineCause:
                return {Flag::CoverClosed, Flag::PaperFedByPaperFeedButton, Flag::PrintingStopsDueToPaperEnd,
                        Flag::ErrorOccurred};
            case Request::ErrorCause:
                return {Flag::RecoverableErrorOccurred, Flag::AutocutterErrorOccurred,
                        Flag::UnrecoverableErrorOccurred, Flag::AutoRecoverableErrorOccurred};
            case Request::RollPaperSensor:
                return {Flag::RollPaperNearEndSensorPaperAdequate, Flag::RollPaperEndSensorPaperPresent};
            case Request::InkA:
                return {Flag::InkNearEndDetected, Flag::InkEndDetected, Flag::InkCartridgeDetected,
                        Flag::CleaningPerformed};
            case Request::InkB:
                return {Flag::InkNearEndDetected, Flag::InkEndDetected, Flag::InkCartridgeDetected};
            case Request::Peeler:
                return {Flag::WaitingForLabelToBeRemoved, Flag::PaperPresentInLabelPeelingDetector};
            case Request::Interface:
                return {Flag::PrintingMultipleInterfacesEnabled};
            case Request::DMD:
                return {Flag::DMDTransmissionStatusReady};
        }
        return {};
    }

    std::string toString(RealTimeStatusRequest request) {
        switch (request) {
            case Request::Printer:
                return "Printer status";
            case Request::OfflineCause:
                return "Offline cause status";
            case Request::ErrorCause:
                return "Error cause status";
            case Request::RollPaperSensor:
                return "Roll paper sensor status";
            case Request::InkA:
                return "Ink A status";
            case Request::InkB:
                return "Ink B status";
            case Request::Peeler:
                return "Peeler status";
            case Request::Interface:
                return "Interface status";
            case Request::DMD:
                return "DMD status";
        }
        return "Unknown";
    }

    std::string toString(RealTimeStatusFlag flag) {
        switch (flag) {
            case Flag::DrawerKickOutConnectorPin3Low:
                return "DrawerKickOutConnectorPin3Low";
            case Flag::Online:
                return "Online";
            case Flag::WaitingForOnlineRecovery:
                return "WaitingForOnlineRecovery";
            case Flag::PaperFeedButtonPressed:
                return "PaperFeedButtonPressed";
            case Flag::CoverClosed:
                return "CoverClosed";
            case Flag::PaperFedByPaperFeedButton:
                return "PaperFedByPaperFeedButton";
            case Flag::PrintingStopsDueToPaperEnd:
                return "PrintingStopsDueToPaperEnd";
            case Flag::ErrorOccurred:
                return "ErrorOccurred";
            case Flag::RecoverableErrorOccurred:
                return "RecoverableErrorOccurred";
            case Flag::AutocutterErrorOccurred:
                return "AutocutterErrorOccurred";
            case Flag::UnrecoverableErrorOccurred:
                return "UnrecoverableErrorOccurred";
            case Flag::AutoRecoverableErrorOccurred:
                return "AutoRecoverableErrorOccurred";
            case Flag::RollPaperNearEndSensorPaperAdequate:
                return "RollPaperNearEndSensorPaperAdequate";
            case Flag::RollPaperEndSensorPaperPresent:
                return "RollPaperEndSensorPaperPresent";
            case Flag::InkNearEndDetected:
                return "InkNearEndDetected";
            case Flag::InkEndDetected:
                return "InkEndDetected";
            case Flag::InkCartridgeDetected:
                return "InkCartridgeDetected";
            case Flag::CleaningPerformed:
                return "CleaningPerformed";
            case Flag::WaitingForLabelToBeRemoved:
                return "WaitingForLabelToBeRemoved";
            case Flag::PaperPresentInLabelPeelingDetector:
                return "PaperPresentInLabelPeelingDetector";
            case Flag::PrintingMultipleInterfacesEnabled:
                return "PrintingMultipleInterfacesEnabled";
            case Flag::DMDTransmissionStatusReady:
                return "DMDTransmissionStatusReady";
        }
        return "Unknown";
    }

    RealTimeStatusResponse::RealTimeStatusResponse(RealTimeStatusRequest request, uint8_t raw)
            : request_(request), raw_(raw) {}

    RealTimeStatusRequest RealTimeStatusResponse::request() const {
        return request_;
    }

    uint8_t RealTimeStatusResponse::raw() const {
        return raw_;
    }

    bool RealTimeStatusResponse::matchesTemplate(uint8_t raw) {
        const std::bitset<8> bits(raw);
        return !bits[0] && bits[1] && bits[4] && !bits[7];
    }

    std::map<RealTimeStatusFlag, bool> RealTimeStatusResponse::decode() const {
        if (!matchesTemplate(raw_)) {
            throw types::ProtocolException("invalid " + toString(request_) + " byte: " + std::to_string(raw_));
        }

        const std::bitset<8> bits(raw_);
        std::map<Flag, bool> flags;

        switch (request_) {
            case Request::Printer:
                flags[Flag::DrawerKickOutConnectorPin3Low] = !bits[2];
                flags[Flag::Online] = !bits[3];
                flags[Flag::WaitingForOnlineRecovery] = bits[5];
                flags[Flag::PaperFeedButtonPressed] = bits[6];
                break;
            case Request::OfflineCause:
                flags[Flag::CoverClosed] = !bits[2];
                flags[Flag::PaperFedByPaperFeedButton] = bits[3];
                flags[Flag::PrintingStopsDueToPaperEnd] = bits[5];
                flags[Flag::ErrorOccurred] = bits[6];
                break;
            case Request::ErrorCause:
                flags[Flag::RecoverableErrorOccurred] = bits[2];
                flags[Flag::AutocutterErrorOccurred] = bits[3];
                flags[Flag::UnrecoverableErrorOccurred] = bits[5];
                flags[Flag::AutoRecoverableErrorOccurred] = bits[6];
                break;
            case Request::RollPaperSensor:
                flags[Flag::RollPaperNearEndSensorPaperAdequate] = !bits[2] && !bits[3];
                flags[Flag::RollPaperEndSensorPaperPresent] = !bits[5] && !bits[6];
                break;
            case Request::InkA:
                flags[Flag::CleaningPerformed] = bits[6];
                [[fallthrough]];
            case Request::InkB:
                flags[Flag::InkNearEndDetected] = bits[2];
                flags[Flag::InkEndDetected] = bits[3];
                flags[Flag::InkCartridgeDetected] = !bits[5];
                break;
            case Request::Peeler:
                flags[Flag::WaitingForLabelToBeRemoved] = bits[2];
                flags[Flag::PaperPresentInLabelPeelingDetector] = !bits[5];
                break;
            case Request::Interface:
                flags[Flag::PrintingMultipleInterfacesEnabled] = bits[2];
                break;
            case Request::DMD:
                flags[Flag::DMDTransmissionStatusReady] = !bits[2];
                break;
        }
        return flags;
    }

} // namespace escpos::domain::status
