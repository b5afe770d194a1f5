#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace escpos::domain::status {

    enum class RealTimeStatusRequest {
        Printer,
        OfflineCause,
        ErrorCause,
        RollPaperSensor,
        InkA,
        InkB,
        Peeler,
        Interface,
        DMD
    };

    enum class RealTimeStatusFlag {
        DrawerKickOutConnectorPin3Low,
        Online,
        WaitingForOnlineRecovery,
        PaperFeedButtonPressed,
        CoverClosed,
        PaperFedByPaperFeedButton,
        PrintingStopsDueToPaperEnd,
        ErrorOccurred,
        RecoverableErrorOccurred,
        AutocutterErrorOccurred,
        UnrecoverableErrorOccurred,
        AutoRecoverableErrorOccurred,
        RollPaperNearEndSensorPaperAdequate,
        RollPaperEndSensorPaperPresent,
        InkNearEndDetected,
        InkEndDetected,
        InkCartridgeDetected,
        CleaningPerformed,
        WaitingForLabelToBeRemoved,
        PaperPresentInLabelPeelingDetector,
        PrintingMultipleInterfacesEnabled,
        DMDTransmissionStatusReady
    };

    /// Coppia (n, a) inviata con DLE EOT.
    std::pair<uint8_t, uint8_t> requestBytes(RealTimeStatusRequest request);

    /// Insieme fisso dei flag decodificati per la categoria.
    std::vector<RealTimeStatusFlag> flagsOf(RealTimeStatusRequest request);

    std::string toString(RealTimeStatusRequest request);

    std::string toString(RealTimeStatusFlag flag);

    /**
     * @brief Byte di stato accoppiato alla richiesta che lo ha prodotto.
     *
     * Il byte non identifica la propria categoria: la decodifica usa sempre la richiesta associata.
     */
    class RealTimeStatusResponse {
    public:
        RealTimeStatusResponse(RealTimeStatusRequest request, uint8_t raw);

        RealTimeStatusRequest request() const;

        uint8_t raw() const;

        /// bit0 = 0, bit1 = 1, bit4 = 1, bit7 = 0.
        static bool matchesTemplate(uint8_t raw);

        /**
         * @throws types::ProtocolException se il byte non rispetta il template.
         */
        std::map<RealTimeStatusFlag, bool> decode() const;

    private:
        RealTimeStatusRequest request_;
        uint8_t raw_;
    };

} // namespace escpos::domain::status
